#include "kinswing/types.hpp"
#include <cctype>
#include <stdexcept>

namespace kinswing {

Alphabet::Alphabet(const std::string& symbols) {
    index_.fill(-1);
    for (char c : symbols) {
        const char upper = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        if (index_[static_cast<unsigned char>(upper)] >= 0) continue;  // duplicate
        if (symbols_.size() >= 127) {
            throw std::invalid_argument("Alphabet has more than 127 symbols");
        }
        const int8_t idx = static_cast<int8_t>(symbols_.size());
        symbols_.push_back(upper);
        index_[static_cast<unsigned char>(upper)] = idx;
        index_[static_cast<unsigned char>(std::tolower(static_cast<unsigned char>(upper)))] = idx;
    }
}

const Alphabet& Alphabet::amino_acids() {
    static const Alphabet aa("ACDEFGHIKLMNPQRSTVWY");
    return aa;
}

}  // namespace kinswing
