#pragma once

#include <kj/common.h>
#include <kj/map.h>
#include <kj/string.h>

namespace doco::proxy {

using TemplateValues = kj::HashMap<kj::String, kj::String>;

/**
 * @brief Render a text template with `{{ .key }}` actions.
 *
 * Whitespace around the key inside the braces is ignored. Everything outside actions is
 * copied verbatim, including single braces.
 *
 * @throws kj::Exception (from TemplateException) on an unterminated or malformed action or a
 * key missing from values; the description carries the byte offset of the action.
 */
[[nodiscard]] kj::String render_template(kj::StringPtr text, const TemplateValues& values);

} // namespace doco::proxy
