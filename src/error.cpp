#include <docpatch-cpp/error.hpp>

#include <string>
#include <utility>

namespace docpatch_cpp {

namespace {

auto assertion_message(const std::string& path, const Document& expected,
                       const Document& actual) -> std::string {
    constexpr auto lossy = Document::error_handler_t::replace;
    return "test failed at " + (path.empty() ? std::string{"<root>"} : path) +
           ": expected " + expected.dump(-1, ' ', false, lossy) +
           ", found " + actual.dump(-1, ' ', false, lossy);
}

}  // anonymous namespace

PatchAssertionError::PatchAssertionError(std::string path, Document expected, Document actual)
    : Error{ErrorKind::patch_assertion_failed, assertion_message(path, expected, actual)},
      path_{std::move(path)},
      expected_(std::move(expected)),
      actual_(std::move(actual)) {}

}  // namespace docpatch_cpp
