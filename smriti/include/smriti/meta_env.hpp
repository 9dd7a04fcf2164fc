#pragma once
// MetaEnv: the root environment of the federation
//
// Node ^0 of the meta env denotes the meta env itself. Every other env is
// represented by an atomic node in the meta env; the env object it stands
// for is owned here, keyed by that node.

#include "env_prelude.hpp"
#include "environment.hpp"
#include <map>
#include <memory>
#include <vector>

namespace smriti {

class MetaEnv {
public:
    MetaEnv() : base_(std::make_unique<MemEnvironment>()) {
        env_prelude::populate(*base_, Node(LocalNode(0), LocalNode(0)));
    }

    MetaEnv(const MetaEnv&) = delete;
    MetaEnv& operator=(const MetaEnv&) = delete;

    Environment& base() { return *base_; }
    const Environment& base() const { return *base_; }

    // nullptr if e does not name an env
    Environment* env(LocalNode e) {
        if (e.id == 0) return base_.get();
        auto it = envs_.find(e);
        return it == envs_.end() ? nullptr : it->second.get();
    }
    const Environment* env(LocalNode e) const {
        if (e.id == 0) return base_.get();
        auto it = envs_.find(e);
        return it == envs_.end() ? nullptr : it->second.get();
    }

    bool is_env(LocalNode e) const { return e.id == 0 || envs_.count(e) > 0; }

    // Allocate a meta node for a fresh env and populate its prelude
    LocalNode insert_env() {
        LocalNode node = base_->insert_node(std::nullopt);
        attach_env(node);
        return node;
    }

    // Make an existing meta node stand for a fresh env (used while loading)
    Environment& attach_env(LocalNode node) {
        if (node.id == 0 || node.is_triple() || !base_->contains(node)) {
            throw lang_error(LangError::invalid_argument(Sexp(Node(LocalNode(0), node)),
                                                         "plain meta env node"));
        }
        auto env = std::make_unique<MemEnvironment>();
        env_prelude::populate(*env, Node(LocalNode(0), node));
        Environment& ref = *env;
        envs_[node] = std::move(env);
        return ref;
    }

    // Ascending; excludes the meta env itself
    std::vector<LocalNode> env_nodes() const {
        std::vector<LocalNode> out;
        for (const auto& [node, _] : envs_) out.push_back(node);
        return out;
    }

    size_t env_count() const { return envs_.size(); }

private:
    std::unique_ptr<Environment> base_;
    std::map<LocalNode, std::unique_ptr<Environment>> envs_;
};

} // namespace smriti
