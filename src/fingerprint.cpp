#include "strata/fingerprint.hpp"

#include "strata/nspawn.hpp"
#include "strata/utility.hpp"

#include <algorithm>
#include <array>
#include <openssl/evp.h>
#include <string_view>

namespace strata {

namespace {

constexpr std::string_view INST_PREFIX = "Inst ";

/// Splits on single spaces into at most `max_fields`; the last field keeps the remainder.
std::vector<std::string_view> split_fields(std::string_view line, size_t max_fields) {
    std::vector<std::string_view> fields;
    size_t start = 0;
    while (fields.size() + 1 < max_fields) {
        size_t space = line.find(' ', start);
        if (space == std::string_view::npos)
            break;
        fields.push_back(line.substr(start, space - start));
        start = space + 1;
    }
    fields.push_back(line.substr(start));
    return fields;
}

} // namespace

Result<DependencySet> parse_build_deps(const std::vector<std::string> &lines) {
    DependencySet deps;
    for (const auto &line : lines) {
        if (!line.starts_with(INST_PREFIX))
            continue;

        auto fields = split_fields(line, 4);
        if (fields.size() != 4) {
            return fail(ErrorKind::ParseFailure, "Cannot parse dependency from '{}'", line);
        }
        std::string_view version = fields[2];
        if (!version.starts_with('(')) {
            return fail(ErrorKind::ParseFailure, "Cannot parse version from '{}'", line);
        }
        version.remove_prefix(1);
        if (version.empty()) {
            return fail(ErrorKind::ParseFailure, "Cannot parse version from '{}'", line);
        }
        deps.push_back({std::string(fields[1]), std::string(version)});
    }

    std::sort(deps.begin(), deps.end());
    deps.erase(std::unique(deps.begin(), deps.end()), deps.end());
    return deps;
}

std::string canonical_form(const DependencySet &deps) {
    std::string out = "[";
    for (size_t i = 0; i < deps.size(); ++i) {
        if (i > 0)
            out += ", ";
        out += std::format("('{}', '{}')", deps[i].name, deps[i].version);
    }
    out += ']';
    return out;
}

Result<std::string> fingerprint_of(const DependencySet &deps) {
    const std::string block = canonical_form(deps);

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_len = 0;
    if (EVP_Digest(block.data(), block.size(), digest.data(), &digest_len, EVP_sha224(), nullptr) != 1) {
        return fail(ErrorKind::IoFailure, "SHA-224 digest failed");
    }

    static constexpr char HEX[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        hex += HEX[(digest[i] >> 4) & 0xF];
        hex += HEX[digest[i] & 0xF];
    }
    hex.resize(FINGERPRINT_LEN);
    return hex;
}

Result<Resolution> compute_fingerprint(CommandRunner &runner, const std::filesystem::path &l1_dir,
                                       const std::filesystem::path &source_dir, const std::string &machine) {
    NamespaceOptions opts{
        .root = l1_dir,
        .machine = machine,
        .read_only = true,
        .overlays = {{source_dir, CONTAINER_SRC_DIR}},
    };
    auto out = nspawn(runner, opts, {"/usr/bin/apt-get", "build-dep", "-s", "."}, /*quiet=*/true);
    if (!out)
        return std::unexpected(out.error());

    auto deps = parse_build_deps(out->lines);
    if (!deps)
        return std::unexpected(deps.error());

    auto fingerprint = fingerprint_of(*deps);
    if (!fingerprint)
        return std::unexpected(fingerprint.error());

    Resolution resolution;
    resolution.fingerprint = std::move(*fingerprint);
    resolution.deps = std::move(*deps);
    return resolution;
}

} // namespace strata
