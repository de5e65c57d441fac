#include "common/concurrency_controller.hpp"
#include <algorithm>
#include <stdexcept>

namespace hjudge {
using namespace std;

concurrency_controller::slot::slot(concurrency_controller *controller) : controller(controller) {}

concurrency_controller::slot::slot(slot &&other) noexcept : controller(other.controller) {
    other.controller = nullptr;
}

concurrency_controller::slot &concurrency_controller::slot::operator=(slot &&other) noexcept {
    if (this != &other) {
        release();
        controller = other.controller;
        other.controller = nullptr;
    }
    return *this;
}

concurrency_controller::slot::~slot() {
    release();
}

void concurrency_controller::slot::release() {
    if (controller) {
        controller->release();
        controller = nullptr;
    }
}

concurrency_controller::slot::operator bool() const {
    return controller != nullptr;
}

concurrency_controller::concurrency_controller(int capacity) : total(capacity) {
    if (capacity < 1) throw invalid_argument("capacity of concurrency controller must be positive");
}

concurrency_controller::slot concurrency_controller::acquire() {
    unique_lock<mutex> lock(mut);
    cv.wait(lock, [this] { return used < total; });
    max_used = max(max_used, ++used);
    return slot(this);
}

concurrency_controller::slot concurrency_controller::try_acquire() {
    scoped_lock<mutex> lock(mut);
    if (used >= total) return slot();
    max_used = max(max_used, ++used);
    return slot(this);
}

void concurrency_controller::release() {
    {
        scoped_lock<mutex> lock(mut);
        --used;
    }
    cv.notify_one();
}

int concurrency_controller::running() const {
    scoped_lock<mutex> lock(mut);
    return used;
}

int concurrency_controller::peak() const {
    scoped_lock<mutex> lock(mut);
    return max_used;
}

int concurrency_controller::capacity() const {
    return total;
}

}  // namespace hjudge
