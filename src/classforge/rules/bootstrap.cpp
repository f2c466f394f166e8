#include "classforge/rules/bootstrap.hpp"
#include "classforge/class_writer.hpp"

#include <llvm/Support/Endian.h>

namespace classforge::rules {

namespace {

constexpr uint8_t OP_NEW = 0xBB, OP_DUP = 0x59, OP_ALOAD_2 = 0x2C, OP_ALOAD_3 = 0x2D;
constexpr uint8_t OP_INVOKEVIRTUAL = 0xB6, OP_INVOKESPECIAL = 0xB7, OP_ARETURN = 0xB0;

class BootstrapStage : public ClassVisitor {
public:
    BootstrapStage(ClassVisitor& next, TransformContext& ctx) : ClassVisitor(&next), ctx_(ctx) {}

    void visit(const ClassHeader& header) override {
        interface_ = (header.access & acc::Interface) != 0;
        ClassVisitor::visit(header);
    }

    void visitMethod(const MemberInfo& method) override {
        if(method.name == kBootstrapName && method.descriptor == kBootstrapDescriptor) present_ = true;
        ClassVisitor::visitMethod(method);
    }

    void visitEnd() override {
        if(!present_){
            SymbolTable* syms = symbols();
            if(!syms) throw std::logic_error("BootstrapRule: chain has no class writer");
            MemberInfo m;
            m.access = acc::Public | acc::Static | acc::Synthetic;
            m.name = kBootstrapName;
            m.descriptor = kBootstrapDescriptor;
            m.attributes.push_back(Attribute{ "Code", build_bootstrap_code(*syms) });
            ClassVisitor::visitMethod(m);
            present_ = true;
            ctx_.requireMinimumClassVersion(interface_ ? kBootstrapInterfaceVersion : kBootstrapClassVersion);
            ctx_.markModified();
        }
        ClassVisitor::visitEnd();
    }

private:
    TransformContext& ctx_;
    bool interface_ = false;
    bool present_ = false;
};

} // namespace

std::vector<uint8_t> build_bootstrap_code(SymbolTable& symbols){
    uint16_t callSite = symbols.addClass("java/lang/invoke/ConstantCallSite");
    uint16_t asType = symbols.addMethodref("java/lang/invoke/MethodHandle", "asType",
                                           "(Ljava/lang/invoke/MethodType;)Ljava/lang/invoke/MethodHandle;");
    uint16_t init = symbols.addMethodref("java/lang/invoke/ConstantCallSite", "<init>",
                                         "(Ljava/lang/invoke/MethodHandle;)V");

    // new ConstantCallSite; dup; aload_3 (target); aload_2 (type);
    // invokevirtual asType; invokespecial <init>; areturn
    std::vector<uint8_t> code;
    auto op = [&](uint8_t b){ code.push_back(b); };
    auto opIdx = [&](uint8_t b, uint16_t idx){ code.push_back(b); code.push_back(uint8_t(idx >> 8)); code.push_back(uint8_t(idx & 0xFF)); };
    opIdx(OP_NEW, callSite);
    op(OP_DUP);
    op(OP_ALOAD_3);
    op(OP_ALOAD_2);
    opIdx(OP_INVOKEVIRTUAL, asType);
    opIdx(OP_INVOKESPECIAL, init);
    op(OP_ARETURN);

    std::vector<uint8_t> attr(8);
    llvm::support::endian::write16be(attr.data(), 4);     // max_stack
    llvm::support::endian::write16be(attr.data() + 2, 4); // max_locals
    llvm::support::endian::write32be(attr.data() + 4, static_cast<uint32_t>(code.size()));
    attr.insert(attr.end(), code.begin(), code.end());
    attr.insert(attr.end(), { 0, 0,   // exception_table_length
                              0, 0 }); // attributes_count
    return attr;
}

std::unique_ptr<ClassVisitor> BootstrapRule::transform(LoaderHandle, const std::string&, ClassVisitor& next, TransformContext& ctx){
    return std::make_unique<BootstrapStage>(next, ctx);
}

} // namespace classforge::rules
