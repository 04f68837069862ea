#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace hotview {

// Base of every error raised while turning markup into a render tree.
class MarkupError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Byte-level lexing failure: unterminated constructs, stray '<', bad attributes.
class StreamReadError : public MarkupError {
public:
    StreamReadError(const std::string& message, std::size_t offset)
        : MarkupError(message + " at offset " + std::to_string(offset))
        , offset_(offset) {}

    std::size_t offset() const { return offset_; }

private:
    std::size_t offset_;
};

// Structural failure: unmatched or mismatched tags, multiple roots.
class MalformedMarkupError : public MarkupError {
public:
    using MarkupError::MarkupError;
};

class InvalidColorLiteralError : public MarkupError {
public:
    explicit InvalidColorLiteralError(const std::string& literal)
        : MarkupError("invalid color literal '" + literal + "'")
        , literal_(literal) {}

    const std::string& literal() const { return literal_; }

private:
    std::string literal_;
};

class InvalidLengthLiteralError : public MarkupError {
public:
    explicit InvalidLengthLiteralError(const std::string& literal)
        : MarkupError("invalid length literal '" + literal + "'")
        , literal_(literal) {}

    const std::string& literal() const { return literal_; }

private:
    std::string literal_;
};

class MissingRequiredAttributeError : public MarkupError {
public:
    MissingRequiredAttributeError(const std::string& tag, const std::string& attribute)
        : MarkupError("<" + tag + "> requires attribute '" + attribute + "'")
        , tag_(tag)
        , attribute_(attribute) {}

    const std::string& tag() const { return tag_; }
    const std::string& attribute() const { return attribute_; }

private:
    std::string tag_;
    std::string attribute_;
};

} // namespace hotview
