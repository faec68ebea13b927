#include <docpatch-cpp/document.hpp>
#include <docpatch-cpp/error.hpp>

#include <algorithm>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace docpatch_cpp {

auto sorted_keys(const Document& doc) -> Document {
    if (doc.is_object()) {
        auto keys = std::vector<std::string>{};
        keys.reserve(doc.size());
        for (auto it = doc.begin(); it != doc.end(); ++it) {
            keys.push_back(it.key());
        }
        std::ranges::sort(keys);
        auto result = Document::object();
        for (const auto& key : keys) {
            result[key] = sorted_keys(doc.at(key));
        }
        return result;
    }
    if (doc.is_array()) {
        auto result = Document::array();
        for (const auto& element : doc) {
            result.push_back(sorted_keys(element));
        }
        return result;
    }
    return doc;
}

auto equivalent(const Document& a, const Document& b) -> bool {
    if (a.is_object() && b.is_object()) {
        if (a.size() != b.size()) return false;
        for (auto it = a.begin(); it != a.end(); ++it) {
            auto other = b.find(it.key());
            if (other == b.end() || !equivalent(it.value(), *other)) return false;
        }
        return true;
    }
    if (a.is_array() && b.is_array()) {
        return std::equal(a.begin(), a.end(), b.begin(), b.end(),
                          [](const Document& x, const Document& y) { return equivalent(x, y); });
    }
    return a == b;
}

auto serialize(const Document& doc, const SerializeOptions& options) -> std::string {
    try {
        if (options.sort_keys) {
            return sorted_keys(doc).dump(options.indent, ' ', false);
        }
        return doc.dump(options.indent, ' ', false);
    } catch (const nlohmann::ordered_json::type_error& e) {
        // dump() rejects strings that are not valid UTF-8
        throw Error{ErrorKind::parse_error, std::string{"cannot serialize document: "} + e.what()};
    }
}

auto parse_document(std::string_view text, std::string_view source) -> Document {
    try {
        return Document::parse(text.begin(), text.end());
    } catch (const nlohmann::ordered_json::parse_error& e) {
        throw Error{ErrorKind::parse_error,
                    "failed to parse JSON from " + std::string{source} + ": " + e.what()};
    }
}

}  // namespace docpatch_cpp
