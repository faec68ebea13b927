#include <docpatch-cpp/pointer.hpp>

#include <docpatch-cpp/error.hpp>
#include <docpatch-cpp/log.hpp>

#include <charconv>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace docpatch_cpp {

// =============================================================================
// Pointer syntax (RFC 6901)
// =============================================================================

namespace {

/// Unescape one raw token in a single left-to-right pass, so "~01"
/// yields "~1" rather than "/".
auto unescape_token(std::string_view raw, std::string_view pointer) -> std::string {
    auto token = std::string{};
    token.reserve(raw.size());
    for (auto i = std::size_t{0}; i < raw.size(); ++i) {
        if (raw[i] != '~') {
            token.push_back(raw[i]);
            continue;
        }
        if (i + 1 < raw.size() && raw[i + 1] == '0') {
            token.push_back('~');
        } else if (i + 1 < raw.size() && raw[i + 1] == '1') {
            token.push_back('/');
        } else {
            throw Error{ErrorKind::malformed_pointer,
                        "invalid '~' escape in JSON Pointer: " + std::string{pointer}};
        }
        ++i;
    }
    return token;
}

}  // anonymous namespace

auto Pointer::parse(std::string_view text) -> Pointer {
    if (text.empty()) return Pointer{};
    if (text[0] != '/') {
        throw Error{ErrorKind::malformed_pointer,
                    "JSON Pointer must start with '/' or be empty: " + std::string{text}};
    }
    auto tokens = std::vector<std::string>{};
    auto pos = std::size_t{1};
    while (pos <= text.size()) {
        auto next = text.find('/', pos);
        tokens.push_back(unescape_token(text.substr(pos, next - pos), text));
        if (next == std::string_view::npos) break;
        pos = next + 1;
    }
    return Pointer{std::move(tokens)};
}

auto Pointer::escape(std::string_view token) -> std::string {
    auto result = std::string{};
    result.reserve(token.size());
    for (char c : token) {
        if (c == '~') { result += "~0"; }
        else if (c == '/') { result += "~1"; }
        else { result += c; }
    }
    return result;
}

auto Pointer::to_string() const -> std::string {
    auto result = std::string{};
    for (const auto& token : tokens_) {
        result += '/';
        result += escape(token);
    }
    return result;
}

auto Pointer::parent() const -> Pointer {
    if (tokens_.empty()) return Pointer{};
    return Pointer{std::vector<std::string>(tokens_.begin(), tokens_.end() - 1)};
}

auto operator/(Pointer ptr, std::string token) -> Pointer {
    ptr.push_back(std::move(token));
    return ptr;
}

auto operator/(Pointer ptr, std::size_t index) -> Pointer {
    ptr.push_back(index);
    return ptr;
}

void to_json(Document& j, const Pointer& ptr) {
    j = ptr.to_string();
}

auto parse_array_index(std::string_view token) -> std::optional<std::size_t> {
    if (token.empty()) return std::nullopt;
    // Leading zeros are not allowed per RFC 6901 (except "0" itself)
    if (token.size() > 1 && token[0] == '0') return std::nullopt;
    auto result = std::size_t{0};
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), result);
    if (ec == std::errc{} && ptr == token.data() + token.size()) return result;
    return std::nullopt;
}

// =============================================================================
// Navigation
// =============================================================================

namespace {

/// Render the first `depth` tokens of `ptr`, for error messages.
auto prefix(const Pointer& ptr, std::size_t depth) -> std::string {
    auto result = std::string{};
    auto n = std::size_t{0};
    for (const auto& token : ptr) {
        if (n++ == depth) break;
        result += '/';
        result += Pointer::escape(token);
    }
    return result.empty() ? std::string{"<root>"} : result;
}

/// Resolve an array token that must name an existing element.
auto existing_index(const Document& array, const std::string& token,
                    const Pointer& ptr, std::size_t depth) -> std::size_t {
    if (token == "-") {
        throw Error{ErrorKind::invalid_token,
                    "'-' does not name an existing element: " + ptr.to_string()};
    }
    auto idx = parse_array_index(token);
    if (!idx || *idx >= array.size()) {
        throw Error{ErrorKind::index_out_of_range,
                    "index '" + token + "' out of range for array of size " +
                    std::to_string(array.size()) + " at " + prefix(ptr, depth)};
    }
    return *idx;
}

/// Step from `node` into the child named by the token at `depth`.
template <typename Node>
auto step(Node& node, const Pointer& ptr, std::size_t depth) -> Node& {
    const auto& token = ptr.tokens()[depth];
    if (node.is_object()) {
        auto it = node.find(token);
        if (it == node.end()) {
            throw Error{ErrorKind::not_found,
                        "no key '" + token + "' at " + prefix(ptr, depth) +
                        " (resolving " + ptr.to_string() + ")"};
        }
        return *it;
    }
    if (node.is_array()) {
        return node[existing_index(node, token, ptr, depth)];
    }
    throw Error{ErrorKind::type_mismatch,
                "cannot descend into " + std::string{node.type_name()} + " at " +
                prefix(ptr, depth) + " (resolving " + ptr.to_string() + ")"};
}

/// Walk to the container that holds the final token of `ptr`.
///
/// With `create_missing` set, absent object keys along the way become
/// empty objects. Arrays are never extended here.
auto resolve_parent(Document& doc, const Pointer& ptr, bool create_missing) -> Document& {
    auto* current = &doc;
    for (auto depth = std::size_t{0}; depth + 1 < ptr.size(); ++depth) {
        const auto& token = ptr.tokens()[depth];
        if (create_missing && current->is_object() && !current->contains(token)) {
            log::get()->debug("creating missing parent {}", prefix(ptr, depth + 1));
            current = &((*current)[token] = Document::object());
            continue;
        }
        current = &step(*current, ptr, depth);
    }
    if (!current->is_object() && !current->is_array()) {
        throw Error{ErrorKind::type_mismatch,
                    "parent of " + ptr.to_string() + " is a " +
                    std::string{current->type_name()} + ", not a container"};
    }
    return *current;
}

}  // anonymous namespace

auto get(const Document& doc, const Pointer& ptr) -> const Document& {
    const auto* current = &doc;
    for (auto depth = std::size_t{0}; depth < ptr.size(); ++depth) {
        current = &step(*current, ptr, depth);
    }
    return *current;
}

auto contains(const Document& doc, const Pointer& ptr) -> bool {
    const auto* current = &doc;
    for (const auto& token : ptr) {
        if (current->is_object()) {
            auto it = current->find(token);
            if (it == current->end()) return false;
            current = &*it;
        } else if (current->is_array()) {
            auto idx = parse_array_index(token);
            if (!idx || *idx >= current->size()) return false;
            current = &(*current)[*idx];
        } else {
            return false;
        }
    }
    return true;
}

// =============================================================================
// Mutation
// =============================================================================

void add(Document& doc, const Pointer& ptr, Document value, const PatchOptions& options) {
    if (ptr.is_root()) {
        doc = std::move(value);
        return;
    }
    auto& parent = resolve_parent(doc, ptr, options.create_missing_parents);
    const auto& last = ptr.back();

    if (parent.is_object()) {
        auto it = parent.find(last);
        if (it == parent.end()) {
            parent[last] = std::move(value);
        } else if (options.add_mode == AddMode::upsert) {
            *it = std::move(value);
        } else {
            throw Error{ErrorKind::target_exists, "add target exists: " + ptr.to_string()};
        }
        return;
    }

    auto& items = parent.get_ref<Document::array_t&>();
    auto idx = (last == "-") ? std::optional<std::size_t>{items.size()} : parse_array_index(last);
    if (!idx || *idx > items.size()) {
        throw Error{ErrorKind::index_out_of_range,
                    "insert index '" + last + "' out of range for array of size " +
                    std::to_string(items.size()) + " at " + ptr.to_string()};
    }
    items.insert(items.begin() + static_cast<std::ptrdiff_t>(*idx), std::move(value));
}

void replace(Document& doc, const Pointer& ptr, Document value) {
    if (ptr.is_root()) {
        doc = std::move(value);
        return;
    }
    auto& parent = resolve_parent(doc, ptr, false);
    const auto& last = ptr.back();

    if (parent.is_object()) {
        auto it = parent.find(last);
        if (it == parent.end()) {
            throw Error{ErrorKind::not_found, "replace target missing: " + ptr.to_string()};
        }
        *it = std::move(value);
        return;
    }
    parent[existing_index(parent, last, ptr, ptr.size() - 1)] = std::move(value);
}

auto remove(Document& doc, const Pointer& ptr) -> Document {
    if (ptr.is_root()) {
        throw Error{ErrorKind::root_removal_forbidden, "cannot remove the document root"};
    }
    auto& parent = resolve_parent(doc, ptr, false);
    const auto& last = ptr.back();

    if (parent.is_object()) {
        auto it = parent.find(last);
        if (it == parent.end()) {
            throw Error{ErrorKind::not_found, "remove target missing: " + ptr.to_string()};
        }
        auto removed = std::move(*it);
        parent.erase(last);
        return removed;
    }
    auto& items = parent.get_ref<Document::array_t&>();
    auto idx = existing_index(parent, last, ptr, ptr.size() - 1);
    auto removed = std::move(items[idx]);
    items.erase(items.begin() + static_cast<std::ptrdiff_t>(idx));
    return removed;
}

}  // namespace docpatch_cpp
