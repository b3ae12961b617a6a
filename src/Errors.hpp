#pragma once
#include <stdexcept>
#include <string>

// Base for every error the generator core reports to its caller.
class PassclipError : public std::runtime_error {
public:
    explicit PassclipError(const std::string& what) : std::runtime_error(what) {}
};

// Word list source missing or unreadable.
class NotFoundError : public PassclipError {
public:
    explicit NotFoundError(const std::string& what) : PassclipError(what) {}
};

// Operation attempted without the state it needs (no corpus, empty corpus,
// no table, bad order or settings).
class InvalidStateError : public PassclipError {
public:
    explicit InvalidStateError(const std::string& what) : PassclipError(what) {}
};

// A prefix reached during generation has no recorded continuation.
class ExhaustedTransitionsError : public PassclipError {
public:
    ExhaustedTransitionsError(const std::string& prefix, const std::string& what)
        : PassclipError(what), m_prefix(prefix) {}

    const std::string& prefix() const { return m_prefix; }

private:
    std::string m_prefix;
};
