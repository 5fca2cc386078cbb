#pragma once

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <string>

// =============================================================================
// OBJECT BUFFER - "<type> <length>\0<content>"
// =============================================================================
// The exact byte framing git hashes an object under. The declared length is
// re-derived on every content length change, so the buffer can be hashed
// as-is at any time.
// =============================================================================

class ObjectBuffer {
public:
    ObjectBuffer() = default;

    // Build from an object type ("commit", "blob", ...) and its raw content
    static ObjectBuffer fromContent(const std::string& type, const std::string& content);

    // Parse framed bytes; fails if the header is missing or inconsistent
    static bool parse(const std::string& raw, ObjectBuffer& out, std::string& error);

    const std::string& bytes() const { return bytes_; }
    const std::string& type() const { return type_; }
    std::string content() const { return bytes_.substr(headerSize_); }

    size_t size() const { return bytes_.size(); }
    size_t headerSize() const { return headerSize_; }
    size_t contentSize() const { return bytes_.size() - headerSize_; }

    const char* data() const { return bytes_.data(); }
    char* contentData() { return &bytes_[headerSize_]; }
    const char* contentData() const { return bytes_.data() + headerSize_; }

    // Insert bytes into the content and rebuild the length header
    void insertContent(size_t pos, const std::string& text);

    friend std::ostream& operator<<(std::ostream& os, const ObjectBuffer& obj) {
        os << obj.type_ << " " << obj.contentSize() << " (" << obj.size() << " bytes framed)";
        return os;
    }

private:
    void fixHeader();

    std::string type_;
    std::string bytes_;
    size_t headerSize_ = 0;  // includes the NUL separator
};

// =============================================================================
// NONCE FIELD - descriptor of a header line "<name> <value>"
// =============================================================================
// Offsets are relative to the content, so they survive a change of width of
// the decimal length header.
struct NonceField {
    size_t valueStart = 0;  // first (most significant) symbol
    size_t width = 0;

    size_t rightmost() const { return valueStart + width - 1; }
};

bool isValidAlphabet(const std::string& alphabet);
bool isValidFieldName(const std::string& name);

// Find "<name> " at the start of a header line, or insert "\n<name> <zero>"
// before the blank line that ends the headers. Fails if there is no blank line.
bool locateOrCreateField(ObjectBuffer& obj, const std::string& name, char zeroSymbol,
                         NonceField& field, std::string& error);

// Widen the field by one symbol inserted right after "<name> "
void growField(ObjectBuffer& obj, NonceField& field, char fillSymbol);

// Positional rendering, least significant symbol rightmost. Returns false if
// the value does not fit the current width.
bool renderCandidate(ObjectBuffer& obj, const NonceField& field, uint64_t value,
                     const std::string& alphabet);

bool parseFieldValue(const ObjectBuffer& obj, const NonceField& field,
                     const std::string& alphabet, uint64_t& value);
