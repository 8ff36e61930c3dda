// QX Analytics - Random Sources Implementation

#include <qx/analytics/random.hpp>

namespace qx::analytics {

std::unique_ptr<SeededRandom> make_entropy_random() {
    std::random_device rd;
    uint64_t seed = (static_cast<uint64_t>(rd()) << 32) | rd();
    return std::make_unique<SeededRandom>(seed);
}

}  // namespace qx::analytics
