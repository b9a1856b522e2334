#ifndef PLONKISH_ERROR_HANDLING_ERROR_HANDLING_H_
#define PLONKISH_ERROR_HANDLING_ERROR_HANDLING_H_

#include <exception>
#include <string>
#include <utility>

namespace plonkish {

/*
  Thrown on a fatal condition: a broken invariant, a misconfigured circuit or a caller violating a
  usage contract. Circuit construction that throws this exception must be discarded.
*/
class PlonkishException : public std::exception {
 public:
  explicit PlonkishException(std::string message, size_t message_len)
      : message_(std::move(message)), message_len_(message_len) {}
  const char* what() const noexcept override { return message_.c_str(); }

  /*
    Returns the message without the attached stack trace.
  */
  const std::string Message() const { return message_.substr(0, message_len_); }

 private:
  std::string message_;
  size_t message_len_;
};

/*
  Throws a PlonkishException whose message is "<file>:<line_num>: <message>" followed by the stack
  trace of the caller.
*/
[[noreturn]] void ThrowPlonkishException(
    const std::string& message, const char* file, size_t line_num) noexcept(false);

#define THROW_PLONKISH_EXCEPTION(msg) ::plonkish::ThrowPlonkishException(msg, __FILE__, __LINE__)

/*
  We use "do {} while(false);" pattern to force the user to use ; after the macro.
*/
#define ASSERT_IMPL(cond, msg)       \
  do {                               \
    if (!(cond)) {                   \
      THROW_PLONKISH_EXCEPTION(msg); \
    }                                \
  } while (false)

#ifndef NDEBUG
#define ASSERT_DEBUG(cond, msg) ASSERT_IMPL(cond, msg)
#else
#define ASSERT_DEBUG(cond, msg) \
  do {                          \
  } while (false)
#endif

#define ASSERT_RELEASE(cond, msg) ASSERT_IMPL(cond, msg)

}  // namespace plonkish

#endif  // PLONKISH_ERROR_HANDLING_ERROR_HANDLING_H_
