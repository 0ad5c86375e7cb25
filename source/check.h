// A drop-in replacement for the gCHECK macros in glog. Unlike glog, a failed check throws
// CheckFailedError so the failure unwinds to whoever owns the current run.
#pragma once

#include <string>
#include <sstream>
#include <iostream>
#include <exception>
#include <stdexcept>

#define XCHECK(p) mvis::Check(static_cast<bool>(p), #p, __FILE__, __LINE__)

#define XCHECK_EQ(a, b) mvis::CheckEQ(a, b, #a, #b, __FILE__, __LINE__)
#define XCHECK_NE(a, b) mvis::CheckNE(a, b, #a, #b, __FILE__, __LINE__)
#define XCHECK_LT(a, b) mvis::CheckLT(a, b, #a, #b, __FILE__, __LINE__)
#define XCHECK_LE(a, b) mvis::CheckLE(a, b, #a, #b, __FILE__, __LINE__)
#define XCHECK_GT(a, b) mvis::CheckGT(a, b, #a, #b, __FILE__, __LINE__)
#define XCHECK_GE(a, b) mvis::CheckGE(a, b, #a, #b, __FILE__, __LINE__)

namespace mvis {

class CheckFailedError : public std::runtime_error {
 public:
  explicit CheckFailedError(const std::string& what) : std::runtime_error(what) {}
};

struct CheckBase {
  const bool condition;
  std::ostringstream message;

  CheckBase(const bool& condition, const char* filename, const int line) : condition(condition)
  {
    if (!condition) {
      message << filename << ":" << line << ": ";
    }
  }

  // Throwing from the destructor is what lets the streamed message be appended before the
  // check fires. Never throw while another exception is already unwinding.
  virtual ~CheckBase() noexcept(false)
  {
    if (!condition) {
      if (std::uncaught_exceptions() > 0) {
        std::cerr << message.str() << std::endl;
        return;
      }
      throw CheckFailedError(message.str());
    }
  }

  template <typename S>
  CheckBase& operator<<(const S& s)
  {
    if (!condition) {
      message << s;
    }
    return *this;
  }
};

struct Check : public CheckBase {
  Check(const bool& condition, const char* expr, const char* filename, const int line)
      : CheckBase(condition, filename, line)
  {
    if (!condition) {
      message << "XCHECK(" << expr << ") FAILED: ";
    }
  }
};

#define BINARY_CHECK(OP_NAME, OP)                                                                \
  template <typename TA, typename TB>                                                            \
  struct Check##OP_NAME : public CheckBase {                                                     \
    Check##OP_NAME(                                                                              \
        const TA& a,                                                                             \
        const TB& b,                                                                             \
        const char* a_expr,                                                                      \
        const char* b_expr,                                                                      \
        const char* filename,                                                                    \
        const int line)                                                                          \
        : CheckBase(a OP b, filename, line)                                                      \
    {                                                                                            \
      if (!this->condition) {                                                                    \
        this->message << "XCHECK_" #OP_NAME "(" << a_expr << ", " << b_expr << ") FAILED: " << a \
                      << " " #OP " " << b << ", ";                                               \
      }                                                                                          \
    }                                                                                            \
  }

BINARY_CHECK(EQ, ==);
BINARY_CHECK(NE, !=);
BINARY_CHECK(LT, <);
BINARY_CHECK(LE, <=);
BINARY_CHECK(GT, >);
BINARY_CHECK(GE, >=);

#undef BINARY_CHECK

}  // end namespace mvis
