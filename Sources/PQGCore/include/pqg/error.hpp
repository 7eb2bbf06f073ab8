#pragma once

#ifdef __cplusplus

#include <stdexcept>
#include <string>
#include <vector>

namespace pqg {

class error : public std::runtime_error {
public:
    explicit error(const std::string& msg) : std::runtime_error(msg) {}
};

/// SQLite failure (open, prepare, step).
class db_error : public error {
public:
    explicit db_error(const std::string& msg) : error(msg) {}
};

/// Type registration conflict, use before initialize(), or an object whose
/// shape does not match its registered type.
class config_error : public error {
public:
    explicit config_error(const std::string& msg) : error(msg) {}
};

/// An edge write named one or more PIDs that do not resolve to a row.
class referential_integrity_error : public error {
public:
    explicit referential_integrity_error(std::vector<std::string> missing)
        : error(make_message(missing)), missing_(std::move(missing)) {}

    const std::vector<std::string>& missing() const noexcept { return missing_; }

private:
    std::vector<std::string> missing_;

    static std::string make_message(const std::vector<std::string>& missing) {
        std::string msg = "Unresolved pid(s) in edge write:";
        for (const auto& pid : missing) {
            msg += " " + pid;
        }
        return msg;
    }
};

/// The decomposition guard refused an object graph.
class structural_error : public error {
public:
    explicit structural_error(const std::string& msg) : error(msg) {}
};

/// An edge does not match the typed-edge catalog.
class edge_type_error : public error {
public:
    explicit edge_type_error(const std::string& msg) : error(msg) {}
};

} // namespace pqg

#endif // __cplusplus
