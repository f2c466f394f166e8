// Configurable rules used by the pipeline tests.
#pragma once
#include "classforge/transform.hpp"

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace testrules {

using namespace classforge;

// Participates (unless `decline`), and when the header passes through records
// the requests it was configured with.
struct Script {
    bool decline = false;
    bool modify = true;
    int minVersion = -1;
    int upgrade = -1;
    bool bootstrap = false;
    bool throwOnVisit = false;
    uint16_t toggleAccess = 0; // XORed into the class access flags
};

class ScriptedRule : public TransformRule {
public:
    ScriptedRule(std::string name, Script script) : name_(std::move(name)), script_(script) {}

    std::unique_ptr<ClassVisitor> transform(LoaderHandle, const std::string&, ClassVisitor& next, TransformContext& ctx) override {
        ++offered;
        if(script_.decline) return nullptr;
        return std::make_unique<Stage>(next, ctx, script_, this);
    }
    std::string name() const override { return name_; }

    std::atomic<int> offered{0};
    std::atomic<int> visited{0};
    BootstrapHandle lastHandle;

private:
    class Stage : public ClassVisitor {
    public:
        Stage(ClassVisitor& next, TransformContext& ctx, Script s, ScriptedRule* owner)
            : ClassVisitor(&next), ctx_(ctx), s_(s), owner_(owner) {}
        void visit(const ClassHeader& header) override {
            ++owner_->visited;
            if(s_.throwOnVisit) throw std::runtime_error("scripted failure in " + owner_->name_);
            ClassHeader h = header;
            h.access = static_cast<uint16_t>(h.access ^ s_.toggleAccess);
            if(s_.modify) ctx_.markModified();
            if(s_.minVersion >= 0) ctx_.requireMinimumClassVersion(s_.minVersion);
            if(s_.upgrade >= 0) ctx_.upgradeClassVersion(s_.upgrade);
            if(s_.bootstrap) owner_->lastHandle = ctx_.acquireBootstrap();
            ClassVisitor::visit(h);
        }
    private:
        TransformContext& ctx_;
        Script s_;
        ScriptedRule* owner_;
    };

    std::string name_;
    Script script_;
};

// Appends its tag to a shared journal for every event it sees, to observe
// the order in which chained stages receive events.
class JournalRule : public TransformRule {
public:
    JournalRule(std::string tag, std::vector<std::string>& journal) : tag_(std::move(tag)), journal_(journal) {}

    std::unique_ptr<ClassVisitor> transform(LoaderHandle, const std::string&, ClassVisitor& next, TransformContext& ctx) override {
        return std::make_unique<Stage>(next, ctx, tag_, journal_);
    }
    std::string name() const override { return "Journal(" + tag_ + ")"; }

private:
    class Stage : public ClassVisitor {
    public:
        Stage(ClassVisitor& next, TransformContext& ctx, const std::string& tag, std::vector<std::string>& journal)
            : ClassVisitor(&next), ctx_(ctx), tag_(tag), journal_(journal) {}
        void visit(const ClassHeader& h) override { journal_.push_back(tag_ + ":visit"); ctx_.markModified(); ClassVisitor::visit(h); }
        void visitEnd() override { journal_.push_back(tag_ + ":end"); ClassVisitor::visitEnd(); }
    private:
        TransformContext& ctx_;
        std::string tag_;
        std::vector<std::string>& journal_;
    };

    std::string tag_;
    std::vector<std::string>& journal_;
};

inline std::shared_ptr<ScriptedRule> scripted(std::string name, Script s){ return std::make_shared<ScriptedRule>(std::move(name), s); }

} // namespace testrules
