#include "asyncq/types.hpp"
#include <stdexcept>

namespace asyncq::queue {

std::optional<int> ValidateCapacity(std::optional<int> capacity) {
    if (capacity.has_value() && capacity.value() <= 0) {
        throw std::invalid_argument("Capacity must be positive");
    }
    return capacity;
}

}  // namespace asyncq::queue
