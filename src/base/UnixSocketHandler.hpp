#ifndef __DW_UNIX_SOCKET_HANDLER__
#define __DW_UNIX_SOCKET_HANDLER__

#include "SocketHandler.hpp"

namespace dw {
/**
 * @brief Shared POSIX socket plumbing with a mutex per tracked descriptor.
 * Concrete handlers only decide how a connection is opened.
 */
class UnixSocketHandler : public SocketHandler {
 public:
  UnixSocketHandler();
  virtual ~UnixSocketHandler() {}

  /**
   * @brief Blocks with select() until the fd becomes readable.
   */
  virtual bool waitForData(int fd, int64_t sec, int64_t usec);
  /** @brief Reads up to `count` bytes while holding the per-socket mutex. */
  virtual ssize_t read(int fd, void* buf, size_t count);
  /** @brief Writes up to `count` bytes while holding the per-socket mutex. */
  virtual ssize_t write(int fd, const void* buf, size_t count);
  /** @brief Shuts down both directions so blocked readers wake up. */
  virtual void shutdown(int fd);
  /** @brief Closes the descriptor and removes it from the tracked set. */
  virtual void close(int fd);

  /**
   * @brief Starts tracking an already connected descriptor (e.g. one half of
   * a socketpair or an inherited socket).
   * @return The same descriptor.
   */
  int adopt(int fd);

 protected:
  /**
   * @brief Ensures that a descriptor is tracked and has its own mutex.
   */
  void addToActiveSockets(int fd);
  /**
   * @brief Performs per-socket initialization (non-blocking, signal handling).
   */
  virtual void initSocket(int fd);
  /**
   * @brief Looks up the mutex guarding fd.
   * @return NULL when the descriptor is not (or no longer) tracked.
   */
  shared_ptr<recursive_mutex> getSocketMutex(int fd);

  /** @brief Mutex per active socket to ensure serial read/write. */
  map<int, shared_ptr<recursive_mutex>> activeSocketMutexes;
  /** @brief Guards access to the active socket map. */
  recursive_mutex globalMutex;
};
}  // namespace dw

#endif  // __DW_UNIX_SOCKET_HANDLER__
