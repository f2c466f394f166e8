#include "classforge/artifact.hpp"

namespace classforge {

const ClassReader& Artifact::reader(){
    if(!reader_) reader_ = std::make_unique<ClassReader>(bytes_);
    return *reader_;
}

const std::vector<std::string>& Artifact::stringConstants(){
    if(!constants_) constants_ = reader().stringConstants();
    return *constants_;
}

void Artifact::replace(std::vector<uint8_t> bytes){
    reader_.reset();
    constants_.reset();
    bytes_ = std::move(bytes);
}

} // namespace classforge
