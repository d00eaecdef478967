#include "sync/model/Pass.hpp"

using namespace sv::sync::model;
using namespace std::chrono;

void Pass::start() { timestamp_begin = system_clock::now(); }
void Pass::stop() { timestamp_end = system_clock::now(); }

uint64_t Pass::duration_ms() const {
    return duration_cast<milliseconds>(timestamp_end - timestamp_begin).count();
}
