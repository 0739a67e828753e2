#include "doco/core/service_group.h"

#include <kj/debug.h>

namespace doco::core {

void ServiceGroup::add(kj::StringPtr name, RunFunc run, InterruptFunc interrupt) {
  KJ_REQUIRE(!started_, "cannot add a service to a running group", name);
  actors_.add(Actor{kj::str(name), kj::mv(run), kj::mv(interrupt)});
}

kj::Maybe<kj::StringPtr> ServiceGroup::first_exited() const {
  KJ_IF_SOME(index, first_exit_) {
    return actors_[index].name.asPtr();
  }
  return kj::none;
}

kj::Promise<void> ServiceGroup::run() {
  KJ_REQUIRE(!started_, "service group already started");
  started_ = true;

  if (actors_.empty()) {
    return kj::READY_NOW;
  }

  auto builder = kj::heapArrayBuilder<kj::Promise<void>>(actors_.size());
  for (size_t i = 0; i < actors_.size(); ++i) {
    auto& actor = actors_[i];
    KJ_LOG(INFO, "starting service", actor.name);
    // evalNow turns a synchronous throw from run() into a rejection of this actor only.
    builder.add(kj::evalNow([&actor]() { return actor.run(); })
                    .then([this, i]() { on_actor_exit(i, kj::none); },
                          [this, i](kj::Exception&& e) { on_actor_exit(i, kj::mv(e)); }));
  }

  return kj::joinPromises(builder.finish()).then([this]() -> kj::Promise<void> {
    KJ_IF_SOME(error, result_) {
      return kj::mv(error);
    }
    return kj::READY_NOW;
  });
}

void ServiceGroup::on_actor_exit(size_t index, kj::Maybe<kj::Exception> error) {
  auto& actor = actors_[index];
  actor.finished = true;

  KJ_IF_SOME(e, error) {
    KJ_LOG(ERROR, "service failed", actor.name, e);
  } else {
    KJ_LOG(INFO, "service stopped", actor.name);
  }

  if (first_exit_ == kj::none) {
    first_exit_ = index;

    kj::Exception reason = [&]() {
      KJ_IF_SOME(e, error) {
        return kj::Exception(e);
      }
      return kj::Exception(kj::Exception::Type::DISCONNECTED, __FILE__, __LINE__,
                           kj::str("service '", actor.name, "' exited"));
    }();

    for (size_t j = 0; j < actors_.size(); ++j) {
      auto& sibling = actors_[j];
      if (j == index || sibling.interrupted) {
        continue;
      }
      sibling.interrupted = true;
      KJ_LOG(INFO, "interrupting service", sibling.name, "trigger", actor.name);
      sibling.interrupt(reason);
    }
  }

  if (result_ == kj::none) {
    KJ_IF_SOME(e, error) {
      result_ = kj::mv(e);
    }
  }
}

} // namespace doco::core
