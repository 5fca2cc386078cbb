#include "object_buffer.hpp"
#include <bitset>
#include <cstring>
#include <limits>

ObjectBuffer ObjectBuffer::fromContent(const std::string& type, const std::string& content)
{
    ObjectBuffer obj;
    obj.type_ = type;
    obj.bytes_ = content;
    obj.headerSize_ = 0;
    obj.fixHeader();
    return obj;
}

bool ObjectBuffer::parse(const std::string& raw, ObjectBuffer& out, std::string& error)
{
    const size_t nul = raw.find('\0');
    if (nul == std::string::npos) {
        error = "object has no header separator";
        return false;
    }

    const size_t space = raw.find(' ');
    if (space == std::string::npos || space == 0 || space > nul) {
        error = "object header has no type";
        return false;
    }

    const std::string lengthText = raw.substr(space + 1, nul - space - 1);
    if (lengthText.empty() ||
        lengthText.find_first_not_of("0123456789") != std::string::npos) {
        error = "object header length is not a number: '" + lengthText + "'";
        return false;
    }

    const size_t contentSize = raw.size() - nul - 1;
    if (lengthText != std::to_string(contentSize)) {
        error = "object header declares " + lengthText + " bytes, content has " +
                std::to_string(contentSize);
        return false;
    }

    out.type_ = raw.substr(0, space);
    out.bytes_ = raw;
    out.headerSize_ = nul + 1;
    return true;
}

void ObjectBuffer::insertContent(size_t pos, const std::string& text)
{
    bytes_.insert(headerSize_ + pos, text);
    fixHeader();
}

void ObjectBuffer::fixHeader()
{
    const size_t contentSize = bytes_.size() - headerSize_;
    std::string header = type_ + " " + std::to_string(contentSize);
    header.push_back('\0');
    bytes_.replace(0, headerSize_, header);
    headerSize_ = header.size();
}

// =============================================================================
// FIELD HELPERS
// =============================================================================

bool isValidAlphabet(const std::string& alphabet)
{
    if (alphabet.size() < 2) return false;

    std::bitset<256> seen;
    for (char c : alphabet) {
        const unsigned char u = static_cast<unsigned char>(c);
        // The value must stay on its own header line
        if (c == ' ' || c == '\n' || c == '\0') return false;
        if (seen[u]) return false;
        seen.set(u);
    }
    return true;
}

bool isValidFieldName(const std::string& name)
{
    if (name.empty()) return false;
    for (char c : name) {
        if (c == ' ' || c == '\n' || c == '\0') return false;
    }
    return true;
}

bool locateOrCreateField(ObjectBuffer& obj, const std::string& name, char zeroSymbol,
                         NonceField& field, std::string& error)
{
    const char* content = obj.contentData();
    const size_t size = obj.contentSize();

    // End of the header lines: the first blank line
    const char* blank = nullptr;
    for (size_t i = 0; i + 1 < size; ++i) {
        if (content[i] == '\n' && content[i + 1] == '\n') {
            blank = content + i;
            break;
        }
    }
    if (blank == nullptr) {
        error = "object has no blank line between headers and body";
        return false;
    }
    const size_t headersEnd = static_cast<size_t>(blank - content);
    const std::string prefix = name + " ";

    // Only line starts inside the header block are candidates
    size_t lineStart = 0;
    while (lineStart <= headersEnd) {
        size_t lineEnd = lineStart;
        while (lineEnd < headersEnd && content[lineEnd] != '\n') ++lineEnd;

        if (lineEnd - lineStart >= prefix.size() &&
            std::memcmp(content + lineStart, prefix.data(), prefix.size()) == 0) {
            field.valueStart = lineStart + prefix.size();
            field.width = lineEnd - field.valueStart;
            if (field.width == 0) {
                growField(obj, field, zeroSymbol);
            }
            return true;
        }
        lineStart = lineEnd + 1;
    }

    std::string line = "\n" + prefix;
    line.push_back(zeroSymbol);
    obj.insertContent(headersEnd, line);

    field.valueStart = headersEnd + 1 + prefix.size();
    field.width = 1;
    return true;
}

void growField(ObjectBuffer& obj, NonceField& field, char fillSymbol)
{
    obj.insertContent(field.valueStart, std::string(1, fillSymbol));
    ++field.width;
}

bool renderCandidate(ObjectBuffer& obj, const NonceField& field, uint64_t value,
                     const std::string& alphabet)
{
    char* digits = obj.contentData() + field.valueStart;
    const uint64_t radix = alphabet.size();

    size_t pos = field.width;
    while (value > 0) {
        if (pos == 0) {
            return false;
        }
        --pos;
        digits[pos] = alphabet[static_cast<size_t>(value % radix)];
        value /= radix;
    }

    // Clear whatever a wider predecessor left behind
    while (pos > 0) {
        --pos;
        digits[pos] = alphabet[0];
    }
    return true;
}

bool parseFieldValue(const ObjectBuffer& obj, const NonceField& field,
                     const std::string& alphabet, uint64_t& value)
{
    const char* digits = obj.contentData() + field.valueStart;
    const uint64_t radix = alphabet.size();
    const uint64_t limit = std::numeric_limits<uint64_t>::max();

    value = 0;
    for (size_t i = 0; i < field.width; ++i) {
        const size_t symbol = alphabet.find(digits[i]);
        if (symbol == std::string::npos) return false;
        if (value > (limit - symbol) / radix) return false;
        value = value * radix + symbol;
    }
    return true;
}
