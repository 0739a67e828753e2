#pragma once

#include <kj/async.h>
#include <kj/common.h>
#include <kj/exception.h>
#include <kj/function.h>
#include <kj/string.h>
#include <kj/vector.h>

namespace doco::core {

/**
 * @brief Runs long-lived services together and tears them all down when one stops.
 *
 * Each actor is a run function, whose promise lives as long as the service, plus an
 * interrupt function that must make that promise settle promptly. When the first actor
 * settles, clean or failed, every other actor is interrupted exactly once with that
 * actor's error or a synthesized DISCONNECTED exception. run() settles only after every
 * actor has settled.
 *
 * Result of run(): the first actor's error; if it stopped cleanly, the first error seen
 * afterwards; resolves only when every actor stopped cleanly.
 *
 * @code
 * ServiceGroup group;
 * group.add("api", [&]() { return api.run(shutdown); },
 *           [&](const kj::Exception& e) { shutdown.cancel(e.getDescription()); });
 * group.run().wait(waitScope);
 * @endcode
 */
class ServiceGroup final {
public:
  using RunFunc = kj::Function<kj::Promise<void>()>;
  using InterruptFunc = kj::Function<void(const kj::Exception&)>;

  ServiceGroup() = default;
  KJ_DISALLOW_COPY_AND_MOVE(ServiceGroup);

  /**
   * @brief Register an actor. Only valid before run().
   */
  void add(kj::StringPtr name, RunFunc run, InterruptFunc interrupt);

  /**
   * @brief Start all actors. May be called once; the group must outlive the returned promise.
   */
  kj::Promise<void> run();

  [[nodiscard]] size_t size() const {
    return actors_.size();
  }

  /**
   * @brief Name of the actor whose exit triggered the shutdown, once one has exited.
   */
  [[nodiscard]] kj::Maybe<kj::StringPtr> first_exited() const;

private:
  struct Actor {
    kj::String name;
    RunFunc run;
    InterruptFunc interrupt;
    bool finished = false;
    bool interrupted = false;
  };

  void on_actor_exit(size_t index, kj::Maybe<kj::Exception> error);

  kj::Vector<Actor> actors_;
  bool started_ = false;
  kj::Maybe<size_t> first_exit_;
  kj::Maybe<kj::Exception> result_;
};

} // namespace doco::core
