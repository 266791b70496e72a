#include "grid_parser.hpp"
#include "parser.hpp"
#include <memory>
#include <stdexcept>
#include <utility>
#include <cstdio>

namespace sign_grid {
namespace text {

namespace {

/**
 * @brief flex スキャナの所有権（例外時も yylex_destroy する）
 */
class ScannerGuard {
public:
    ScannerGuard() {
        if (yylex_init(&scanner_) != 0) {
            throw std::runtime_error("Cannot initialize scanner");
        }
    }
    ~ScannerGuard() { yylex_destroy(scanner_); }

    ScannerGuard(const ScannerGuard&) = delete;
    ScannerGuard& operator=(const ScannerGuard&) = delete;

    yyscan_t get() const { return scanner_; }

private:
    yyscan_t scanner_ = nullptr;
};

/**
 * @brief 文字列入力バッファの所有権
 */
class BufferGuard {
public:
    BufferGuard(const std::string& input, yyscan_t scanner)
        : buffer_(yy_scan_string(input.c_str(), scanner)), scanner_(scanner) {}
    ~BufferGuard() { yy_delete_buffer(buffer_, scanner_); }

    BufferGuard(const BufferGuard&) = delete;
    BufferGuard& operator=(const BufferGuard&) = delete;

private:
    YY_BUFFER_STATE buffer_;
    yyscan_t scanner_;
};

struct FileCloser {
    void operator()(FILE* file) const { fclose(file); }
};

Grid run_parser(yyscan_t scanner) {
    ParserContext ctx;
    int result = yyparse(scanner, &ctx);

    if (result != 0 || ctx.has_error) {
        throw std::runtime_error("Parse error: " + ctx.error_message);
    }
    return std::move(ctx.grid);
}

} // namespace

Grid parse_file(const std::string& filename) {
    std::unique_ptr<FILE, FileCloser> file(fopen(filename.c_str(), "r"));
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filename);
    }

    // scanner は file より先に破棄される
    ScannerGuard scanner;
    yyset_in(file.get(), scanner.get());
    return run_parser(scanner.get());
}

Grid parse_string(const std::string& input) {
    ScannerGuard scanner;
    BufferGuard buffer(input, scanner.get());
    return run_parser(scanner.get());
}

} // namespace text
} // namespace sign_grid
