#include <plume/template/context.hpp>
#include <plume/toml_value.hpp>
#include <plume/log.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>

namespace plume {

// ---------------------------------------------------------------------------
// TemplateContext
// ---------------------------------------------------------------------------

Result<TemplateContext> TemplateContext::parse_toml(const std::string& toml_str,
                                                    const std::string& source_name) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str, source_name);
    } catch (const toml::parse_error& e) {
        PlumeError err{PlumeError::Parse,
            std::string("data TOML parse error: ") + std::string(e.description())};
        const auto& src = e.source();
        err.at(source_name, static_cast<int>(src.begin.line),
               static_cast<int>(src.begin.column), 0);
        return err;
    }

    log::debug("loaded data context %s: %zu top-level keys",
               source_name.c_str(), doc.size());
    return Result<TemplateContext>::ok(TemplateContext(value_from_toml(doc)));
}

Result<TemplateContext> TemplateContext::load_toml(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return PlumeError{PlumeError::IO,
            "cannot open data file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return TemplateContext::parse_toml(ss.str(), path);
}

} // namespace plume
