#include "common/defer.hpp"
#include <glog/logging.h>
#include <exception>

namespace hjudge {
using namespace std;

scoped_guard::scoped_guard() : f() {}

scoped_guard::scoped_guard(function<void()> f) : f(move(f)) {}

scoped_guard::scoped_guard(scoped_guard &&other) noexcept : f(move(other.f)) {
    other.f = nullptr;
}

scoped_guard::~scoped_guard() {
    if (!f) return;
    // 回调抛出的异常不能逃出析构函数
    try {
        f();
    } catch (exception &ex) {
        LOG(ERROR) << "Deferred action failed: " << ex.what();
    }
}

scoped_guard scoped_guard::operator+(function<void()> f) const {
    return scoped_guard(move(f));
}

}  // namespace hjudge
