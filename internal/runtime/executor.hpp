#pragma once

#include <functional>

namespace blegw::runtime {

using Task = std::function<void()>;

// Hands a task to whoever serializes gateway callbacks. Collaborators that
// own threads of their own (gRPC, HTTP I/O) deliver through one of these.
using Executor = std::function<void(Task)>;

} // namespace blegw::runtime
