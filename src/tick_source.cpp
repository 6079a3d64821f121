#include <tripviz/tick_source.hpp>
#include <utility>

namespace tripviz {

void FrameTickSource::start(Callback cb) {
  cb_ = std::move(cb);
  armed_ = static_cast<bool>(cb_);
}

void FrameTickSource::stop() {
  armed_ = false;
}

bool FrameTickSource::pump(double now_s) {
  if (!armed_ || !cb_) return false;
  // Copy: the callback may stop() or start() this source.
  Callback cb = cb_;
  cb(now_s);
  return true;
}

} // namespace tripviz
