// Data.cpp – Length-prefixed word runs.

#include "BitPacket/Data.hpp"
#include "BitPacket/Error.hpp"

#include <stdexcept>

namespace bitpacket {

Data::Data(std::string name, std::unique_ptr<Field> length, LengthResolver word_size)
    : Structure(std::move(name)), word_size_(std::move(word_size)) {
    if (!length)
        throw std::invalid_argument("Data '" + this->name() + "' needs a length field");
    Structure::append(std::move(length));
    content_ = &add<String>("Data", [this](const Field& context) -> size_t {
        return toUnsigned(at(0).value()) * word_size_(context);
    });
}

Value Data::value() const {
    return content_->value();
}

std::string Data::strValue() const {
    return content_->strValue();
}

void Data::setValue(const Value& v) {
    const Bytes& data = toBytes(v);
    const size_t word = word_size_(root());
    if (word == 0 || data.size() % word != 0)
        throw LengthMismatch("Data '" + name() + "': " + std::to_string(data.size()) +
                             " byte(s) is not a multiple of the word size " +
                             std::to_string(word));

    try {
        at(0).setValue(uint64_t{data.size() / word});
    } catch (const SizeExceeded& e) {
        throw ValueTooLong("Data '" + name() + "': " + std::to_string(data.size() / word) +
                           " word(s) do not fit length field '" + at(0).name() + "' (" +
                           e.what() + ")");
    }
    content_->setValue(data);
}

} // namespace bitpacket
