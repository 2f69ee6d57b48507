#include "dynsparse/options.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <unordered_set>

namespace dynsparse {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // anonymous namespace

std::vector<std::string> RiglConfig::validate() const {
    std::vector<std::string> errors;

    if (!schedule) {
        errors.push_back("schedule must be set");
    }

    if (!(sparsity >= 0.0 && sparsity < 1.0)) {
        errors.push_back("sparsity must be in [0, 1) (got " +
                         std::to_string(sparsity) + ")");
    }

    if (block_size.rows < 1 || block_size.cols < 1) {
        errors.push_back("block_size entries must be >= 1 (got " +
                         std::to_string(block_size.rows) + "x" +
                         std::to_string(block_size.cols) + ")");
    }

    static const std::unordered_set<std::string> valid_pooling = {
        "average", "avg", "max"
    };
    if (valid_pooling.find(to_lower(block_pooling)) == valid_pooling.end()) {
        errors.push_back("Unsupported block_pooling: '" + block_pooling + "'");
    }

    static const std::unordered_set<std::string> valid_distributions = {
        "permute_ones"
    };
    if (valid_distributions.find(sparse_distribution) == valid_distributions.end()) {
        errors.push_back("Unsupported sparse_distribution: '" + sparse_distribution + "'");
    }

    if (density) {
        if (density->dtype() != DType::Float32) {
            errors.push_back("density must be float32 (got " +
                             std::string(dtype_name(density->dtype())) + ")");
        } else if (density->num_elements() == 0) {
            errors.push_back("density must not be empty");
        } else {
            const float* d = density->data_ptr<float>();
            for (int64_t i = 0; i < density->num_elements(); ++i) {
                if (!(d[i] >= 0.0f && d[i] <= 1.0f)) {
                    errors.push_back("density values must be in [0, 1] (index " +
                                     std::to_string(i) + " is " + std::to_string(d[i]) + ")");
                    break;
                }
            }
        }
    }

    if (!(noise_std >= 0.0) || std::isinf(noise_std)) {
        errors.push_back("noise_std must be a finite value >= 0 (got " +
                         std::to_string(noise_std) + ")");
    }

    static const std::unordered_set<std::string> valid_grow_init = {
        "zeros", "random_normal", "randomized", "random_uniform", "constant"
    };
    if (valid_grow_init.find(grow_init) == valid_grow_init.end()) {
        errors.push_back("Unsupported grow_init: '" + grow_init + "'");
    }

    if (!std::isfinite(grow_init_value)) {
        errors.push_back("grow_init_value must be finite");
    } else if ((grow_init == "random_normal" || grow_init == "randomized" ||
                grow_init == "random_uniform") &&
               grow_init_value < 0.0) {
        errors.push_back("grow_init_value must be >= 0 for " + grow_init);
    }

    return errors;
}

std::vector<std::string> OptimizerOptions::validate() const {
    std::vector<std::string> errors;

    if (!(learning_rate > 0.0) || std::isinf(learning_rate)) {
        errors.push_back("learning_rate must be a finite value > 0");
    }

    if (!(momentum >= 0.0 && momentum < 1.0)) {
        errors.push_back("momentum must be in [0, 1) (got " +
                         std::to_string(momentum) + ")");
    }

    static const std::unordered_set<std::string> valid_levels = {
        "debug", "info", "warning", "error"
    };
    if (valid_levels.find(log_level) == valid_levels.end()) {
        errors.push_back("Invalid log_level: " + log_level);
    }

    return errors;
}

int log_level_rank(const std::string& level) {
    if (level == "debug") return 0;
    if (level == "info") return 1;
    if (level == "warning") return 2;
    if (level == "error") return 3;
    return 2;
}

} // namespace dynsparse
