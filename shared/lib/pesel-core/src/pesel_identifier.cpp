/**
 * @file pesel_identifier.cpp
 * @brief PESEL identifier value object implementation
 */

#include "pesel/core/pesel_identifier.h"
#include "pesel/core/checksum.h"
#include "exception/exceptions.h"

namespace pesel::core {

PeselIdentifier PeselIdentifier::fromParts(const std::string& datePart, const std::string& sequentialPart) {
    if (datePart.size() != kDatePartLength) {
        throw common::InvalidIdentifierFormatException(datePart, "date part must have 6 digits");
    }
    if (sequentialPart.size() != kSequentialPartLength) {
        throw common::InvalidIdentifierFormatException(sequentialPart, "sequential part must have 4 digits");
    }

    std::string base = datePart + sequentialPart;
    int check = calculateCheckDigit(base);

    base.push_back(static_cast<char>('0' + check));
    return PeselIdentifier(std::move(base));
}

PeselIdentifier PeselIdentifier::fromString(const std::string& text) {
    verifyChecksum(text);
    return PeselIdentifier(text);
}

int PeselIdentifier::sequentialBlock() const {
    int block = 0;
    for (size_t i = kDatePartLength; i < kBaseLength; i++) {
        block = block * 10 + (value_[i] - '0');
    }
    return block;
}

std::ostream& operator<<(std::ostream& os, const PeselIdentifier& id) {
    return os << id.getValue();
}

} // namespace pesel::core
