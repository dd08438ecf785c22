#include <verity/run_control.hpp>

#include <algorithm>

#include <trantor/net/EventLoop.h>
#include <trantor/net/EventLoopThreadPool.h>
#include <trantor/utils/Logger.h>

namespace verity::internal {

CollaboratorPool::CollaboratorPool(size_t threads, size_t max_abandoned)
    : max_abandoned_(max_abandoned),
      load_(std::max<size_t>(1, threads), 0),
      loops_(std::make_unique<trantor::EventLoopThreadPool>(load_.size(),
                                                            "VerityCollaborator")) {
  loops_->start();
}

CollaboratorPool::~CollaboratorPool() {
  size_t abandoned = Abandoned();
  if (abandoned > 0) {
    LOG_WARN << "waiting for " << abandoned << " abandoned collaborator call(s)";
  }
  loops_.reset();
}

size_t CollaboratorPool::Abandoned() const {
  std::lock_guard<std::mutex> lock(mu_);
  return abandoned_;
}

bool CollaboratorPool::Submit(std::function<void()> work, std::shared_ptr<CallState> call) {
  size_t loop = 0;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (abandoned_ >= max_abandoned_) return false;
    loop = static_cast<size_t>(std::min_element(load_.begin(), load_.end()) - load_.begin());
    ++load_[loop];
  }
  loops_->getLoop(loop)->queueInLoop(
      [this, loop, work = std::move(work), call = std::move(call)]() {
        work();
        Finish(loop, call);
      });
  return true;
}

void CollaboratorPool::Finish(size_t loop, const std::shared_ptr<CallState>& call) {
  std::lock_guard<std::mutex> lock(mu_);
  --load_[loop];
  call->done = true;
  if (call->abandoned) --abandoned_;
}

bool CollaboratorPool::Abandon(const std::shared_ptr<CallState>& call) {
  std::lock_guard<std::mutex> lock(mu_);
  if (call->done) return false;
  call->abandoned = true;
  ++abandoned_;
  return true;
}

}  // namespace verity::internal
