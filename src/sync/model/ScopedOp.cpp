#include "sync/model/ScopedOp.hpp"

using namespace ts::sync::model;
using namespace std::chrono;

void ScopedOp::start() { begin = steady_clock::now(); }
void ScopedOp::stop() { end = steady_clock::now(); }

void ScopedOp::start(const uint64_t size_bytes) {
    this->size_bytes = size_bytes;
    start();
}

uint64_t ScopedOp::duration_ms() const {
    if (end < begin) return 0;
    return static_cast<uint64_t>(duration_cast<milliseconds>(end - begin).count());
}
