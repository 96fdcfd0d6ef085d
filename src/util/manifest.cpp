#include <manifold/manifest.hpp>
#include <manifold/log.hpp>
#include <algorithm>
#include <cstdint>
#include <fstream>
#include <limits>
#include <random>
#include <sstream>
#include <system_error>

namespace manifold {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Reading
// ---------------------------------------------------------------------------

static Result<const toml::table*> section_table(const toml::table& doc,
                                                std::string_view key) {
    const toml::node* node = doc.get(key);
    if (!node) return Result<const toml::table*>::ok(nullptr);
    if (!node->is_table()) {
        return ManifoldError{ManifoldError::InvalidManifest,
            "top-level '" + std::string(key) + "' must be a table"};
    }
    return Result<const toml::table*>::ok(node->as_table());
}

Result<CargoManifest> CargoManifest::of(const fs::path& path, toml::table data) {
    CargoManifest m;
    m.path_ = path;

    auto pkg = section_table(data, "package");
    if (pkg.is_err()) return std::move(pkg).error();
    if (pkg.value()) {
        auto parsed = PackageSection::from_toml(*pkg.value());
        if (parsed.is_err()) return std::move(parsed).error();
        m.package = std::move(parsed).value();
    }

    auto ws = section_table(data, "workspace");
    if (ws.is_err()) return std::move(ws).error();
    if (ws.value()) {
        auto parsed = WorkspaceSection::from_toml(*ws.value());
        if (parsed.is_err()) return std::move(parsed).error();
        m.workspace = std::move(parsed).value();
    }

    auto deps = section_table(data, "dependencies");
    if (deps.is_err()) return std::move(deps).error();
    if (deps.value()) {
        m.dependencies = DependenciesSection::from_toml(*deps.value());
    }

    // [[bin]] array-of-tables
    if (const toml::node* bins = data.get("bin")) {
        auto arr = bins->as_array();
        if (!arr) {
            return ManifoldError{ManifoldError::InvalidManifest,
                "'bin' must be an array of tables", "declare targets with [[bin]]"};
        }
        for (const auto& elem : *arr) {
            auto tbl = elem.as_table();
            if (!tbl) {
                return ManifoldError{ManifoldError::InvalidManifest,
                    "'bin' must be an array of tables", "declare targets with [[bin]]"};
            }
            auto bt = BuildTarget::from_toml(*tbl);
            if (bt.is_err()) return std::move(bt).error();
            m.bin.push_back(std::move(bt).value());
        }
    }

    if (!m.package && !m.workspace) {
        return ManifoldError{ManifoldError::InvalidManifest,
            "manifest has neither [package] nor [workspace]",
            "a Cargo manifest must declare at least one of them",
            path.string(), 0};
    }

    m.data_ = std::move(data);
    return Result<CargoManifest>::ok(std::move(m));
}

Result<CargoManifest> CargoManifest::parse(const std::string& toml_str,
                                           const fs::path& path) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str, path.string());
    } catch (const toml::parse_error& e) {
        const auto& src = e.source();
        return ManifoldError{ManifoldError::Parse,
            std::string("TOML parse error: ") + std::string(e.description()),
            "", path.string(), static_cast<int>(src.begin.line)};
    }

    auto result = CargoManifest::of(path, std::move(doc));
    if (result.is_err() && result.error().file.empty()) {
        result.error().file = path.string();
    }
    return result;
}

Result<CargoManifest> CargoManifest::read(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return ManifoldError{ManifoldError::IO,
            "cannot open manifest file: " + path.string(),
            ec ? ec.message() : (fs::exists(path, ec) ? "not a regular file" : "no such file")};
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return ManifoldError{ManifoldError::IO,
            "cannot open manifest file: " + path.string()};
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad() || (ss.str().empty() && fs::file_size(path, ec) > 0)) {
        return ManifoldError{ManifoldError::IO,
            "failed reading manifest file: " + path.string()};
    }

    log::debug("reading manifest %s", path.string().c_str());
    return CargoManifest::parse(ss.str(), path);
}

// ---------------------------------------------------------------------------
// Writing
// ---------------------------------------------------------------------------

toml::table CargoManifest::to_toml() const {
    toml::table result = data_;

    if (!bin.empty()) {
        toml::array arr;
        for (const auto& b : bin) arr.push_back(b.to_toml());
        result.insert_or_assign("bin", std::move(arr));
    } else {
        result.erase("bin");
    }

    if (package) result.insert_or_assign("package", package->to_toml());
    if (workspace) result.insert_or_assign("workspace", workspace->to_toml());
    if (dependencies) result.insert_or_assign("dependencies", dependencies->to_toml());

    return result;
}

// ---------------------------------------------------------------------------
// Serialization
//
// toml::table keeps its keys sorted, so the text is written here rather
// than with toml++'s formatter. Keys that came from the parsed file are
// emitted in the order they appeared there; keys added since follow in
// table order.
// ---------------------------------------------------------------------------

using Entry = std::pair<const toml::key*, const toml::node*>;

static bool is_bare_key(std::string_view k) {
    if (k.empty()) return false;
    for (char c : k) {
        bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                  (c >= '0' && c <= '9') || c == '_' || c == '-';
        if (!ok) return false;
    }
    return true;
}

static std::string format_key(const std::string& k) {
    if (is_bare_key(k)) return k;
    toml::value<std::string> quoted{k};
    std::ostringstream ss;
    ss << toml::toml_formatter{quoted, toml::format_flags::none};
    return ss.str();
}

static std::string header_path(const std::vector<std::string>& path) {
    std::string out;
    for (const auto& part : path) {
        if (!out.empty()) out += '.';
        out += format_key(part);
    }
    return out;
}

// Non-empty array whose elements are all standard (non-inline) tables
static bool is_table_array(const toml::node& node) {
    auto arr = node.as_array();
    if (!arr || arr->empty()) return false;
    for (const auto& elem : *arr) {
        auto tbl = elem.as_table();
        if (!tbl || tbl->is_inline()) return false;
    }
    return true;
}

static bool is_section(const toml::node& node) {
    if (auto tbl = node.as_table()) return !tbl->is_inline();
    return is_table_array(node);
}

static std::vector<Entry> ordered_entries(const toml::table& tbl, const toml::table* ref) {
    std::vector<Entry> entries;
    for (auto&& [k, v] : tbl) entries.emplace_back(&k, &v);

    auto rank = [ref](const toml::key& k) -> std::pair<std::uint64_t, std::uint64_t> {
        constexpr auto kUnknown = std::numeric_limits<std::uint64_t>::max();
        if (!ref) return {kUnknown, kUnknown};
        auto it = ref->find(k.str());
        if (it == ref->end()) return {kUnknown, kUnknown};
        const auto& pos = it->first.source().begin;
        if (pos.line == 0) return {kUnknown, kUnknown};
        return {pos.line, pos.column};
    };

    std::stable_sort(entries.begin(), entries.end(), [&](const Entry& a, const Entry& b) {
        return rank(*a.first) < rank(*b.first);
    });
    return entries;
}

static const toml::table* child_table(const toml::table* ref, const toml::key& k) {
    if (!ref) return nullptr;
    const toml::node* n = ref->get(k.str());
    return n ? n->as_table() : nullptr;
}

static const toml::table* array_element(const toml::table* ref, const toml::key& k, size_t i) {
    if (!ref) return nullptr;
    const toml::node* n = ref->get(k.str());
    auto arr = n ? n->as_array() : nullptr;
    if (!arr || i >= arr->size()) return nullptr;
    return arr->get(i)->as_table();
}

static void write_inline(std::ostream& os, const toml::node& node, const toml::node* ref) {
    if (auto arr = node.as_array()) {
        auto ref_arr = ref ? ref->as_array() : nullptr;
        os << '[';
        for (size_t i = 0; i < arr->size(); i++) {
            if (i > 0) os << ", ";
            const toml::node* elem_ref =
                (ref_arr && i < ref_arr->size()) ? ref_arr->get(i) : nullptr;
            write_inline(os, *arr->get(i), elem_ref);
        }
        os << ']';
    } else if (auto tbl = node.as_table()) {
        if (tbl->empty()) {
            os << "{}";
            return;
        }
        bool first = true;
        os << '{';
        for (const auto& [k, v] : ordered_entries(*tbl, ref ? ref->as_table() : nullptr)) {
            os << (first ? " " : ", ") << format_key(k->str()) << " = ";
            const toml::table* ref_tbl = ref ? ref->as_table() : nullptr;
            write_inline(os, *v, ref_tbl ? ref_tbl->get(k->str()) : nullptr);
            first = false;
        }
        os << " }";
    } else {
        os << toml::toml_formatter{node, toml::format_flags::none};
    }
}

static void write_table(std::ostream& os, const toml::table& tbl, const toml::table* ref,
                        std::vector<std::string>& path, bool& wrote) {
    auto entries = ordered_entries(tbl, ref);

    for (const auto& [k, v] : entries) {
        if (is_section(*v)) continue;
        os << format_key(k->str()) << " = ";
        write_inline(os, *v, ref ? ref->get(k->str()) : nullptr);
        os << '\n';
        wrote = true;
    }

    for (const auto& [k, v] : entries) {
        if (!is_section(*v)) continue;
        path.push_back(k->str());

        if (auto sub = v->as_table()) {
            // A table holding only sub-tables needs no header of its own
            bool has_values = sub->empty();
            for (auto&& [sk, sv] : *sub) {
                if (!is_section(sv)) has_values = true;
            }
            if (has_values) {
                if (wrote) os << '\n';
                os << '[' << header_path(path) << "]\n";
                wrote = true;
            }
            write_table(os, *sub, child_table(ref, *k), path, wrote);
        } else {
            const auto& arr = *v->as_array();
            for (size_t i = 0; i < arr.size(); i++) {
                if (wrote) os << '\n';
                os << "[[" << header_path(path) << "]]\n";
                wrote = true;
                write_table(os, *arr.get(i)->as_table(), array_element(ref, *k, i), path, wrote);
            }
        }

        path.pop_back();
    }
}

std::string CargoManifest::to_toml_string() const {
    std::ostringstream ss;
    std::vector<std::string> path;
    bool wrote = false;
    write_table(ss, to_toml(), &data_, path, wrote);
    return ss.str();
}

// ---------------------------------------------------------------------------
// Saving
// ---------------------------------------------------------------------------

static std::string temp_suffix() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    const char* hex_chars = "0123456789abcdef";
    std::string suffix;
    for (int i = 0; i < 8; ++i) {
        suffix += hex_chars[dis(gen)];
    }
    return suffix;
}

Status CargoManifest::save() const {
    return save(path_);
}

Status CargoManifest::save(const fs::path& path) const {
    if (path.empty()) {
        return ManifoldError{ManifoldError::InvalidArg,
            "manifest has no source location to save to",
            "pass an explicit path to save()"};
    }

    // Write through symlinks to the file they name
    std::error_code ec;
    fs::path target = path;
    std::optional<fs::perms> mode;
    if (fs::exists(path, ec)) {
        target = fs::canonical(path, ec);
        if (ec) {
            return ManifoldError{ManifoldError::IO,
                "cannot resolve " + path.string() + ": " + ec.message()};
        }
        auto st = fs::status(target, ec);
        if (!ec) mode = st.permissions();
    }

    std::string contents = to_toml_string();
    fs::path tmp = target;
    tmp += ".tmp." + temp_suffix();

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return ManifoldError{ManifoldError::IO,
                "cannot open for writing: " + tmp.string()};
        }
        out << contents;
        out.flush();
        if (!out) {
            std::error_code rm_ec;
            fs::remove(tmp, rm_ec);
            return ManifoldError{ManifoldError::IO,
                "failed writing manifest: " + tmp.string()};
        }
    }

    if (mode) {
        fs::permissions(tmp, *mode, fs::perm_options::replace, ec);
        if (ec) log::warn("cannot copy permissions onto %s: %s",
                          tmp.string().c_str(), ec.message().c_str());
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        std::error_code rm_ec;
        fs::remove(tmp, rm_ec);
        return ManifoldError{ManifoldError::IO,
            "cannot replace " + target.string() + ": " + ec.message()};
    }

    log::debug("wrote manifest %s", target.string().c_str());
    return ok_status();
}

} // namespace manifold
