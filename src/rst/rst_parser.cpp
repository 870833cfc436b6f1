#include "rst_parser.hpp"
#include "parser.hpp"
#include <stdexcept>
#include <cstdio>

namespace shift_roster {
namespace rst {

namespace {

/**
 * @brief flex スキャナの所有者
 */
class Scanner {
public:
    Scanner() {
        if (yylex_init(&scanner_) != 0) {
            throw std::runtime_error("Cannot initialize scanner");
        }
    }
    ~Scanner() { yylex_destroy(scanner_); }
    Scanner(const Scanner&) = delete;
    Scanner& operator=(const Scanner&) = delete;

    yyscan_t get() const { return scanner_; }

private:
    yyscan_t scanner_ = nullptr;
};

std::unique_ptr<Model> run_parser(yyscan_t scanner, const std::string& source) {
    ParserContext ctx;
    int result = yyparse(scanner, &ctx);
    if (result != 0 || ctx.has_error) {
        std::string where = source.empty() ? "" : source + ": ";
        throw std::runtime_error("Parse error: " + where + ctx.error_message);
    }
    return std::move(ctx.model);
}

} // namespace

std::unique_ptr<Model> parse_file(const std::string& filename) {
    std::unique_ptr<FILE, int (*)(FILE*)> file(std::fopen(filename.c_str(), "r"), &fclose);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filename);
    }

    Scanner scanner;
    yyset_in(file.get(), scanner.get());
    return run_parser(scanner.get(), filename);
}

std::unique_ptr<Model> parse_string(const std::string& input) {
    Scanner scanner;
    YY_BUFFER_STATE buffer = yy_scan_string(input.c_str(), scanner.get());

    std::unique_ptr<Model> model;
    try {
        model = run_parser(scanner.get(), "");
    } catch (const std::runtime_error&) {
        yy_delete_buffer(buffer, scanner.get());
        throw;
    }
    yy_delete_buffer(buffer, scanner.get());
    return model;
}

} // namespace rst
} // namespace shift_roster
