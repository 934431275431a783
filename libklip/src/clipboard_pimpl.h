#ifndef KLIP_CLIPBOARD_PIMPL_H
#define KLIP_CLIPBOARD_PIMPL_H

#include "klip/clipboard.h"
#include <memory>

namespace klip {

// Platform hooks
Result<std::unique_ptr<ClipboardBackend>>
platform_open_clipboard(const ServerConfig &config);
bool platform_clipboard_available();

} // namespace klip

#endif // KLIP_CLIPBOARD_PIMPL_H
