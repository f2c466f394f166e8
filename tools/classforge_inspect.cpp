// Runs the transformation pipeline over one class file and reports what changed.
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#include <llvm/Support/raw_ostream.h>

#include "classforge/class_reader.hpp"
#include "classforge/rules/string_constant.hpp"
#include "classforge/transformer.hpp"

using namespace classforge;

static std::vector<uint8_t> read_file(const std::string& path){
    std::ifstream ifs(path, std::ios::binary);
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
}

static void describe(const char* label, const ClassReader& r){
    std::cout << label << ": " << r.header().name << " version " << r.majorVersion() << "." << r.header().minorVersion
              << (r.isInterface() ? " (interface)" : "") << ", " << r.methods().size() << " methods\n";
    for(const auto& s : r.stringConstants()) std::cout << "  ldc \"" << s << "\"\n";
}

// Asks for a class-version upgrade on every class it sees.
class UpgradeRule : public TransformRule {
public:
    explicit UpgradeRule(int version) : version_(version) {}
    std::unique_ptr<ClassVisitor> transform(LoaderHandle, const std::string&, ClassVisitor& next, TransformContext& ctx) override {
        ctx.upgradeClassVersion(version_);
        ctx.markModified();
        return std::make_unique<ClassVisitor>(&next);
    }
    std::string name() const override { return "UpgradeRule(" + std::to_string(version_) + ")"; }
private:
    int version_;
};

int main(int argc, char** argv){
    if(argc < 2){
        std::cerr << "usage: classforge_inspect <file.class> [--replace FROM=TO]... [--upgrade N] [--metrics]\n";
        return 1;
    }
    std::string file = argv[1];
    ClassTransformer transformer;
    bool metrics = false;
    for(int i = 2; i < argc; ++i){
        std::string a = argv[i];
        if(a == "--replace" && i + 1 < argc){
            std::string spec = argv[++i];
            auto eq = spec.find('=');
            if(eq == std::string::npos){ std::cerr << "--replace expects FROM=TO\n"; return 1; }
            transformer.rules.add(std::make_shared<rules::StringConstantRule>(spec.substr(0, eq), spec.substr(eq + 1)));
        } else if(a == "--upgrade" && i + 1 < argc){
            transformer.rules.add(std::make_shared<UpgradeRule>(std::atoi(argv[++i])));
        } else if(a == "--metrics"){
            metrics = true;
        } else {
            std::cerr << "unknown argument: " << a << "\n";
            return 1;
        }
    }

    auto bytes = read_file(file);
    if(bytes.empty()){ std::cerr << "failed to read file\n"; return 1; }
    try {
        describe("input", ClassReader(bytes));
    } catch(const format_error& e){
        std::cerr << "not a class file: " << e.what() << "\n";
        return 2;
    }

    ClassReader original(bytes);
    auto out = transformer.transform(nullptr, original.header().name.c_str(), bytes);
    if(!out){
        std::cout << "result: unchanged\n";
    } else {
        std::cout << "result: " << out->size() << " bytes (was " << bytes.size() << ")\n";
        describe("output", ClassReader(*out));
    }
    if(metrics) transformer.metrics().print(llvm::outs());
    return 0;
}
