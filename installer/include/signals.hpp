#pragma once

namespace fortress {
namespace signals {

// Route SIGINT, SIGTERM and SIGHUP to the cancellation flag. The handler
// only sets the flag; cleanup happens on the normal control path.
void install_handlers();

// Restore the handlers that were active before install_handlers()
void restore_handlers();

bool cancel_requested();
void request_cancel();
void reset();

// Signal number that raised the flag, 0 if none
int last_signal();

}  // namespace signals
}  // namespace fortress
