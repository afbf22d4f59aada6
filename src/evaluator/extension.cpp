#include "evaluator/extension.hpp"
#include <dlfcn.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include "common/exceptions.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

shared_library::shared_library(const fs::path &file)
    : file(file), handle(dlopen(fs::absolute(file).c_str(), RTLD_NOW | RTLD_LOCAL)) {
    if (!handle)
        throw configuration_error(fmt::format("unable to load {}: {}", file.string(), dlerror()));
}

shared_library::~shared_library() {
    if (handle) dlclose(handle);
}

void *shared_library::symbol(const string &name) const {
    return dlsym(handle, name.c_str());
}

extension_registry::~extension_registry() {
    // 对象的虚函数表位于共享库中，必须在 dlclose 之前销毁
    checkers.clear();
    generator_list.clear();
    libraries.clear();
}

shared_library &extension_registry::open(const fs::path &file) {
    for (auto &library : libraries)
        if (library->file == file)
            return *library;
    libraries.push_back(make_unique<shared_library>(file));
    return *libraries.back();
}

shared_ptr<checker> extension_registry::load_checker(const fs::path &file) {
    auto &library = open(file);
    auto create = reinterpret_cast<create_checker_fn>(library.symbol(GRADER_CHECKER_SYMBOL));
    if (!create)
        throw configuration_error(fmt::format("{} does not export {}", file.string(), GRADER_CHECKER_SYMBOL));
    shared_ptr<checker> instance(create());
    checkers.push_back(instance);
    LOG(INFO) << "Loaded checker " << file;
    return instance;
}

shared_ptr<generator> extension_registry::load_generator(const fs::path &file) {
    auto &library = open(file);
    auto create = reinterpret_cast<create_generator_fn>(library.symbol(GRADER_GENERATOR_SYMBOL));
    if (!create)
        throw configuration_error(fmt::format("{} does not export {}", file.string(), GRADER_GENERATOR_SYMBOL));
    shared_ptr<generator> instance(create());
    generator_list.push_back(instance);
    LOG(INFO) << "Loaded generator " << file;
    return instance;
}

void extension_registry::add_checker(const shared_ptr<checker> &checker) {
    checkers.push_back(checker);
}

void extension_registry::add_generator(const shared_ptr<generator> &generator) {
    generator_list.push_back(generator);
}

const vector<shared_ptr<generator>> &extension_registry::generators() const {
    return generator_list;
}

}  // namespace grader
