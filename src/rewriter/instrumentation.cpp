#include "buildprobe/rewriter/instrumentation.hpp"

#include <cstdio>

#include "buildprobe/core/logger.hpp"

namespace buildprobe::rewriter {

namespace {

// Placeholder replaced with the artifact path literal.
constexpr std::string_view kArtifactPlaceholder = "@ARTIFACT_PATH@";

constexpr std::string_view kRecorderTemplate = R"PY(
# buildprobe: record setup() parameters instead of building
def __buildprobe_install(artifact_path):
    import json as _json
    import types as _types
    try:
        import builtins as _builtins
    except ImportError:
        import __builtin__ as _builtins

    def _no_input(*args, **kwargs):
        return ''

    _builtins.input = _no_input
    _builtins.raw_input = _no_input

    def _portable(value):
        if isinstance(value, (set, frozenset, tuple, _types.GeneratorType)):
            return list(value)
        return repr(value)

    def _record(*args, **params):
        for index, arg in enumerate(args):
            params[index] = arg
        if 'ext_modules' in params:
            try:
                params['ext_modules'] = [getattr(ext, 'name', str(ext))
                                         for ext in params['ext_modules']]
            except TypeError:
                params['ext_modules'] = str(params['ext_modules'])
        for key in ('distclass', 'cmdclass'):
            if key in params:
                params[key] = str(params[key])
        for key in list(params):
            if isinstance(params[key], _types.GeneratorType):
                params[key] = list(params[key])
        data = _json.dumps(params, default=_portable)
        handle = open(artifact_path, 'wb')
        try:
            handle.write(data.encode('utf-8'))
        finally:
            handle.close()

    try:
        import setuptools as _setuptools
        _setuptools.setup = _record
    except Exception:
        pass
    try:
        from distutils import core as _distutils_core
        _distutils_core.setup = _record
    except Exception:
        pass
    return _no_input


input = raw_input = __buildprobe_install(@ARTIFACT_PATH@)
del __buildprobe_install
# buildprobe: end
)PY";

} // anonymous namespace

auto python_string_literal(std::string_view text) -> std::string {
    bool ascii = true;
    for (char c : text) {
        if (static_cast<unsigned char>(c) >= 0x80) {
            ascii = false;
            break;
        }
    }

    std::string out = ascii ? "'" : "b'";
    for (char c : text) {
        auto byte = static_cast<unsigned char>(c);
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '\'': out += "\\'"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (byte < 0x20 || byte >= 0x7f) {
                    char buf[5];
                    std::snprintf(buf, sizeof(buf), "\\x%02x", byte);
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    out += "'";
    if (!ascii) out += ".decode('utf-8')";
    return out;
}

auto instrumentation_block(const InstrumentationOptions& options) -> std::string {
    std::string block(kRecorderTemplate.substr(1));  // drop leading newline
    auto at = block.find(kArtifactPlaceholder);
    block.replace(at, kArtifactPlaceholder.size(),
                  python_string_literal(options.artifact_path));
    return block;
}

auto rewrite(std::string_view source, const InstrumentationOptions& options) -> ScriptModel {
    auto model = split_script(source);
    model.instrumentation = instrumentation_block(options);
    LOG_DEBUG("Rewriter: preamble {} bytes, body {} bytes{}",
              model.preamble.size(), model.body.size(),
              model.fallback ? " (fallback)" : "");
    return model;
}

} // namespace buildprobe::rewriter
