// MIT License. Copyright (c) 2025 Lifecast Incorporated. Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions: The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software. THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
#include "logger.h"

#include <exception>
#include <ostream>

bool mvis_xpl_include_dev_info = false;

namespace mvis { namespace xpl {

Logger stdoutLogger(std::cout, level::XPL_INFO{});

LevelLogger<level::XPL_DEBUG> debug(stdoutLogger);
LevelLogger<level::XPL_INFO> info(stdoutLogger);
LevelLogger<level::XPL_WARN> warn(stdoutLogger);
LevelLogger<level::XPL_ERROR> error(stdoutLogger);

namespace {

class TerminateHandler {
 public:
  TerminateHandler()
  {
    std::set_terminate([]() {
      std::exception_ptr current = std::current_exception();
      if (current) {
        try {
          std::rethrow_exception(current);
        } catch (const std::exception& e) {
          XPLERROR << "Unhandled exception: " << e.what();
        } catch (const std::string& s) {
          XPLERROR << "Unhandled exception: " << s;
        } catch (...) {
          XPLERROR << "Unhandled exception of unknown type";
        }
      }
      std::abort();
    });
  }
};

}  // namespace

TerminateHandler terminateHandler;

}}  // end namespace mvis::xpl
