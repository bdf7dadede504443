#pragma once

namespace sysreport {

enum class SectionStyle {
    // Title line followed by a dashed underline.
    Banner,
    // "# LABEL:" line.
    Module
};

} // namespace sysreport
