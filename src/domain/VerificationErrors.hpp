/**
 * @file VerificationErrors.hpp
 * @brief Error taxonomy raised by the verification pipeline.
 */

#pragma once
#include <stdexcept>
#include <string>
#include <vector>

namespace sourceproof::domain {

/**
 * @struct ErrorContext
 * @brief Diagnostic context attached to every verification error.
 */
struct ErrorContext {
    std::string loc;                    ///< Location tag, e.g. "[REARRANGE]".
    std::string chain;                  ///< Chain identifier, if known.
    std::vector<std::string> addresses; ///< Addresses involved, if any.
};

/**
 * @class VerificationError
 * @brief Base class for all terminal verification failures.
 */
class VerificationError : public std::runtime_error {
public:
    VerificationError(const std::string& message, ErrorContext context)
        : std::runtime_error(message), m_context(std::move(context)) {}

    const ErrorContext& context() const { return m_context; }

    /** @brief Fills in chain and addresses if the raising site did not know them. */
    void attach(const std::string& chain, const std::vector<std::string>& addresses) {
        if (m_context.chain.empty()) m_context.chain = chain;
        if (m_context.addresses.empty()) m_context.addresses = addresses;
    }

private:
    ErrorContext m_context;
};

/** @brief Missing chain or address list. */
class InputValidationError : public VerificationError {
public:
    using VerificationError::VerificationError;
};

/** @brief No uploaded file parsed as a Solidity metadata document. */
class NoMetadataFound : public VerificationError {
public:
    using VerificationError::VerificationError;
};

/** @brief Inline source content does not hash to its declared digest. */
class SourceHashMismatch : public VerificationError {
public:
    SourceHashMismatch(const std::string& message, ErrorContext context, std::string fileName)
        : VerificationError(message, std::move(context)), m_fileName(std::move(fileName)) {}

    const std::string& fileName() const { return m_fileName; }

private:
    std::string m_fileName;
};

/** @brief A declared source could not be recovered from the upload. */
class SourceNotFound : public VerificationError {
public:
    SourceNotFound(const std::string& message, ErrorContext context, std::string fileName, std::string digest)
        : VerificationError(message, std::move(context))
        , m_fileName(std::move(fileName))
        , m_digest(std::move(digest)) {}

    const std::string& fileName() const { return m_fileName; }
    const std::string& digest() const { return m_digest; }

private:
    std::string m_fileName;
    std::string m_digest;
};

/** @brief compilationTarget does not resolve to exactly one contract. */
class AmbiguousOrMissingTarget : public VerificationError {
public:
    using VerificationError::VerificationError;
};

/** @brief The compiler reported a fatal diagnostic or omitted the target. */
class CompilationError : public VerificationError {
public:
    using VerificationError::VerificationError;
};

/** @brief No candidate address holds matching bytecode. */
class NoMatch : public VerificationError {
public:
    NoMatch(const std::string& message, ErrorContext context, std::string fileName, std::string contractName)
        : VerificationError(message, std::move(context))
        , m_fileName(std::move(fileName))
        , m_contractName(std::move(contractName)) {}

    const std::string& fileName() const { return m_fileName; }
    const std::string& contractName() const { return m_contractName; }

private:
    std::string m_fileName;
    std::string m_contractName;
};

/** @brief Compiled bytecode carries no recognized metadata reference. */
class MetadataReferenceMissing : public VerificationError {
public:
    using VerificationError::VerificationError;
};

} // namespace sourceproof::domain
