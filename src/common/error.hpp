#ifndef REVERIE_COMMON_ERROR_HPP
#define REVERIE_COMMON_ERROR_HPP

#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>

#include <torch/torch.h>

namespace Reverie {
    // Raised when a tensor does not have the rank or extent an operation requires.
    class InvalidShape : public std::invalid_argument {
    public:
        explicit InvalidShape(const std::string& message) : std::invalid_argument(message) {}
    };

    namespace Common {
        inline std::string format_shape(const torch::Tensor& tensor)
        {
            if (!tensor.defined()) {
                return "(undefined)";
            }
            std::ostringstream stream;
            stream << '(';
            for (int64_t i = 0; i < tensor.dim(); ++i) {
                if (i > 0) {
                    stream << ", ";
                }
                stream << tensor.size(i);
            }
            stream << ')';
            return stream.str();
        }
    }
}

#endif // REVERIE_COMMON_ERROR_HPP
