#pragma once
#include "classforge/class_reader.hpp"

#include <memory>
#include <optional>

namespace classforge {

// Class bytes being transformed plus views derived from them. Views are parsed
// on first use and dropped together whenever the bytes are replaced.
class Artifact {
public:
    explicit Artifact(std::vector<uint8_t> bytes) : bytes_(std::move(bytes)) {}

    const std::vector<uint8_t>& bytes() const { return bytes_; }

    const ClassReader& reader();
    bool isInterface(){ return reader().isInterface(); }
    const std::vector<std::string>& stringConstants();

    void replace(std::vector<uint8_t> bytes);

private:
    std::vector<uint8_t> bytes_;
    std::unique_ptr<ClassReader> reader_;
    std::optional<std::vector<std::string>> constants_;
};

} // namespace classforge
