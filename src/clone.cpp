#include <docpatch-cpp/clone.hpp>

#include <docpatch-cpp/log.hpp>

#include <utility>

namespace docpatch_cpp {

void clone(Document& doc, const Pointer& source, const Pointer& dest,
           const std::optional<std::string>& name, const PatchOptions& options) {
    auto copy = Document(get(doc, source));
    if (name && copy.is_object()) {
        copy["name"] = *name;
    }
    log::get()->debug("cloning {} to {}", source.to_string(), dest.to_string());
    add(doc, dest, std::move(copy), options);
}

}  // namespace docpatch_cpp
