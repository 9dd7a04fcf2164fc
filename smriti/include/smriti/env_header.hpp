#pragma once
// EnvHeader: first record of an env file
//
//   (header (version "1.0.0") (node-count N) (triple-count T) extra...)
//
// Entries other than the three known keys are kept verbatim and written
// back on the next serialization of the same env.

#include "environment.hpp"
#include "error.hpp"
#include "log.hpp"
#include "serializer.hpp"
#include "version.hpp"
#include <set>
#include <string>
#include <vector>

namespace smriti {

struct EnvHeader {
    std::string version = version::env_format();
    size_t node_count = 0;
    size_t triple_count = 0;
    std::vector<Sexp> extras;

    static EnvHeader from_env(const Environment& env) {
        EnvHeader h;
        h.node_count = env.node_count();
        h.triple_count = env.triple_count();
        return h;
    }

    Sexp reify() const {
        ConsList out;
        out.append(sym("header"));
        out.append(make_list({sym("version"), Sexp(LangString(version))}));
        out.append(make_list({sym("node-count"), Sexp(Number::u64(node_count))}));
        out.append(make_list({sym("triple-count"), Sexp(Number::u64(triple_count))}));
        for (const auto& e : extras) out.append(e);
        return out.release();
    }

    static EnvHeader reflect(const Sexp& s) {
        if (s.is_primitive() || s.is_nil()) {
            throw deserialize_error(DeserializeError::Type::MissingHeaderSection, s);
        }
        Deserializer d(s);
        Symbol head = d.symbol();
        if (head.str() != "header") {
            throw deserialize_error(DeserializeError::Type::MissingHeaderSection, Sexp(head));
        }

        EnvHeader h;
        std::set<std::string> seen;
        bool has_version = false, has_nodes = false, has_triples = false;
        while (!d.done()) {
            const Sexp& entry = d.next();
            Deserializer e(entry);
            Symbol key = e.symbol();
            if (!seen.insert(key.str()).second) {
                throw deserialize_error(DeserializeError::Type::ExtraneousData, entry,
                                        "duplicate header key " + key.str());
            }
            if (key.str() == "version") {
                h.version = e.string();
                has_version = true;
            } else if (key.str() == "node-count") {
                h.node_count = static_cast<size_t>(e.number().as_u64());
                has_nodes = true;
            } else if (key.str() == "triple-count") {
                h.triple_count = static_cast<size_t>(e.number().as_u64());
                has_triples = true;
            } else {
                log_debug("EnvHeader", "keeping unrecognized entry %s", entry.to_string().c_str());
                h.extras.push_back(entry);
                continue;
            }
            e.finish();
        }
        if (!has_version || !has_nodes || !has_triples) {
            throw deserialize_error(DeserializeError::Type::MissingData, s,
                                    "header needs version, node-count and triple-count");
        }

        int major = 0, minor = 0, patch = 0;
        if (!version::parse_env_format(h.version, major, minor, patch)) {
            throw deserialize_error(DeserializeError::Type::UnexpectedType,
                                    Sexp(LangString(h.version)), "MAJOR.MINOR.PATCH");
        }
        if (major != SMRITI_ENV_FORMAT_VERSION_MAJOR) {
            throw deserialize_error(DeserializeError::Type::IncompatibleVersion,
                                    Sexp(LangString(h.version)),
                                    "reader is " + version::env_format());
        }
        if (!version::env_format_compatible(major, minor)) {
            log_warn("EnvHeader", "env format %s is newer than %s", h.version.c_str(),
                     version::env_format().c_str());
        }
        return h;
    }
};

} // namespace smriti
