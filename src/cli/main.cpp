#include "apischema/exceptions.hpp"
#include "apischema/logging.hpp"
#include "apischema/resolver/resolver.hpp"
#include "apischema/settings.hpp"
#include "apischema/util/json.hpp"
#include "apischema/util/uri.hpp"
#include "apischema/validation/validator.hpp"
#include "apischema/version.hpp"

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{

static int usage(int exit_code = 2)
{
    std::cout << "apischema " << apischema::VERSION_MAJOR << "." << apischema::VERSION_MINOR
              << "." << apischema::VERSION_PATCH << "\n";
    std::cout << "Usage:\n";
    std::cout << "  apischema --help\n";
    std::cout << "  apischema resolve  <file> [--base <uri>] [--pretty]\n";
    std::cout << "  apischema validate <schema> <instance> [--request|--response] [--resolve]\n";
    std::cout << "\n";
    std::cout << "Global options:\n";
    std::cout << "  --log-level <level>   DEBUG, INFO, WARNING or ERROR (env: APISCHEMA_LOG_LEVEL)\n";
    std::cout << "\n";
    std::cout << "validate prints one line per error and exits 1 when the instance is invalid.\n";
    return exit_code;
}

static std::optional<std::string> consume_flag_value(std::vector<std::string>& args,
                                                     const std::string& flag)
{
    for (size_t i = 0; i + 1 < args.size(); ++i)
    {
        if (args[i] == flag)
        {
            std::string value = args[i + 1];
            args.erase(args.begin() + static_cast<long long>(i),
                       args.begin() + static_cast<long long>(i) + 2);
            return value;
        }
    }
    return std::nullopt;
}

static bool consume_flag(std::vector<std::string>& args, const std::string& flag)
{
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (args[i] == flag)
        {
            args.erase(args.begin() + static_cast<long long>(i));
            return true;
        }
    }
    return false;
}

static bool has_unknown_flag(const std::vector<std::string>& args)
{
    for (const auto& a : args)
    {
        if (!a.empty() && a[0] == '-')
        {
            std::cerr << "Unknown option: " << a << "\n";
            return true;
        }
    }
    return false;
}

static apischema::Json resolve_file(const std::string& path, const std::string& base,
                                    const apischema::Settings& settings)
{
    using namespace apischema::resolver;
    auto document = apischema::util::json::read_file(path);
    auto options = ResolverOptions::from_settings(settings);
    options.base_uri = base.empty() ? apischema::util::uri::from_file_path(path) : base;
    ReferenceStore store;
    return resolve_refs(document, store, default_handlers(fetch_options(settings)), options);
}

static int run_resolve(std::vector<std::string> args, const apischema::Settings& settings)
{
    auto base = consume_flag_value(args, "--base");
    bool pretty = consume_flag(args, "--pretty");
    if (has_unknown_flag(args) || args.size() != 1)
        return usage();

    auto resolved = resolve_file(args[0], base.value_or(""), settings);
    std::cout << (pretty ? resolved.dump(2) : resolved.dump()) << "\n";
    return 0;
}

static int run_validate(std::vector<std::string> args, const apischema::Settings& settings)
{
    using namespace apischema;
    bool response = consume_flag(args, "--response");
    bool request = consume_flag(args, "--request");
    bool resolve = consume_flag(args, "--resolve");
    if (has_unknown_flag(args) || args.size() != 2 || (request && response))
        return usage();

    Json schema = resolve ? resolve_file(args[0], "", settings) : util::json::read_file(args[0]);
    Json instance = util::json::read_file(args[1]);

    auto validator = validation::make_validator(
        std::move(schema), response ? Direction::Response : Direction::Request,
        validation::FormatChecker::draft4());

    int count = 0;
    validator.iter_errors(instance).for_each(
        [&count](validation::ValidationError error)
        {
            ++count;
            std::string where = error.json_pointer();
            std::cout << (where.empty() ? "/" : where) << ": " << error.message << "\n";
            return true;
        });
    return count == 0 ? 0 : 1;
}

} // namespace

int main(int argc, char** argv)
{
    if (argc < 2)
        return usage();

    std::string cmd = argv[1];
    if (cmd == "--help" || cmd == "-h")
        return usage(0);

    std::vector<std::string> args;
    for (int i = 2; i < argc; ++i)
        args.emplace_back(argv[i]);

    auto settings = apischema::Settings::from_env();
    if (auto level = consume_flag_value(args, "--log-level"))
        settings.log_level = *level;
    settings.apply_logging();

    try
    {
        if (cmd == "resolve")
            return run_resolve(std::move(args), settings);
        if (cmd == "validate")
            return run_validate(std::move(args), settings);
    }
    catch (const apischema::ResolutionError& e)
    {
        std::cerr << "Resolution failed: " << e.what() << "\n";
        return 2;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }

    return usage();
}
