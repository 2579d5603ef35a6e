#ifndef BEARDMOLD_COMMON_ERRORS_HPP
#define BEARDMOLD_COMMON_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace beardmold {

// Base for every error raised by the mold pipeline
class MoldError : public std::runtime_error {
public:
    explicit MoldError(const std::string& message)
        : std::runtime_error(message) {}
};

// Missing or malformed payload, bad parameters. Fatal before any mesh work.
class InvalidInputError : public MoldError {
public:
    explicit InvalidInputError(const std::string& message)
        : MoldError("invalid input: " + message) {}
};

// A mesh kernel request failed. Feature stages recover per cutter.
class KernelOperationError : public MoldError {
public:
    KernelOperationError(const std::string& operation, const std::string& message)
        : MoldError(operation + " failed: " + message), operation_(operation) {}

    const std::string& operation() const { return operation_; }

private:
    std::string operation_;
};

// The final STL export failed; the statistics sidecar is already on disk.
class ExportError : public MoldError {
public:
    ExportError(const std::string& message, const std::string& stats_path)
        : MoldError("export failed: " + message), stats_path_(stats_path) {}

    const std::string& stats_path() const { return stats_path_; }

private:
    std::string stats_path_;
};

}  // namespace beardmold

#endif // BEARDMOLD_COMMON_ERRORS_HPP
