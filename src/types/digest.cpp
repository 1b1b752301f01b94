#include "types/digest.hpp"
#include <iomanip>
#include <sstream>

namespace zkshard {

bool Digest::operator==(const Digest& rhs) const {
    return words_ == rhs.words_;
}

bool Digest::operator!=(const Digest& rhs) const {
    return !(*this == rhs);
}

std::string Digest::to_hex() const {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (uint64_t w : words_) {
        oss << std::setw(16) << w;
    }
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const Digest& digest) {
    return os << digest.to_hex();
}

} // namespace zkshard
