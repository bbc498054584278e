#ifndef YAPP_SCOPED_LOCK_H
#define YAPP_SCOPED_LOCK_H

#include <etl/mutex.h>

namespace yapp {
namespace util {

// Holds an etl::mutex for the enclosing scope. Not recursive: code running
// under the lock must not take it again.
class ScopedLock {
 public:
  explicit ScopedLock(etl::mutex& mutex) : _mutex(mutex) { _mutex.lock(); }
  ~ScopedLock() { _mutex.unlock(); }

  ScopedLock(const ScopedLock&) = delete;
  ScopedLock& operator=(const ScopedLock&) = delete;

 private:
  etl::mutex& _mutex;
};

}  // namespace util
}  // namespace yapp

#endif  // YAPP_SCOPED_LOCK_H
