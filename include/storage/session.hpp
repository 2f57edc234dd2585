#ifndef SESSION_HPP_
#define SESSION_HPP_

namespace ledger {
namespace storage {

/**
 * Handle for one atomic transaction opened by a Coordinator.
 *
 * Store calls made with the same session commit or roll back together. Each store
 * implementation only accepts sessions created by its own coordinator.
 */
class Session {
 public:
  virtual ~Session() = default;

 protected:
  Session() = default;
  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;
};

}  // namespace storage
}  // namespace ledger

#endif  // SESSION_HPP_
