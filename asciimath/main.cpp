// main.cpp - asciimath command line previewer
//
// Translates AsciiMath notation given on the command line, in a file or on
// standard input (one expression per line) and prints the MathML.

#include "ascii_math.hpp"
#include "../lib/log.h"
#include "../lib/strbuf.h"
#include <stdio.h>
#include <string.h>
#include <unistd.h>
#include <string>

using namespace asciimath;

struct CliOptions {
    TranslateOptions translate;
    const char* input_file;
    bool show_errors;
    bool strict;
};

static void print_help() {
    printf("asciimath - AsciiMath to MathML translator\n\n");
    printf("Usage: asciimath [options] [expression...]\n\n");
    printf("Without an expression or file, one expression per line is read from stdin.\n\n");
    printf("Options:\n");
    printf("  -i, --inline        emit display=\"inline\" instead of \"block\"\n");
    printf("  -p, --pretty        indent the output, one element per line\n");
    printf("  -f, --file <path>   translate each non-blank line of a file\n");
    printf("  -e, --errors        print diagnostics to stderr\n");
    printf("  -s, --strict        exit with status 1 if any diagnostic was produced\n");
    printf("  -h, --help          show this help\n\n");
    printf("Examples:\n");
    printf("  asciimath \"sum_(i=1)^n i^2\"\n");
    printf("  asciimath -p \"[| a; b;; c; d |]\"\n");
    printf("  echo \"sqrt 2\" | asciimath -i\n");
}

// Translate one expression and print it; returns the number of diagnostics
static size_t translate_line(const CliOptions& opts, const char* text, size_t len) {
    ParseErrorList errors(opts.translate.max_errors);
    MathDocument doc;
    MathNode* root = translate_document(&doc, text, len, opts.translate, &errors);

    StrBuf* out = strbuf_new_cap(256);
    if (!out) {
        log_error("out of memory");
        return 1;
    }
    serialize_mathml(out, root, opts.translate.indent);
    if (opts.translate.indent == 0) strbuf_append_char(out, '\n');
    fwrite(out->str, 1, out->length, stdout);
    strbuf_free(out);

    if (opts.show_errors && errors.totalCount() > 0) {
        fprintf(stderr, "%s", errors.formatErrors().c_str());
    }
    return errors.totalCount();
}

// Translate every non-blank line of a buffer
static size_t translate_lines(const CliOptions& opts, const StrBuf* input) {
    size_t diagnostics = 0;
    const char* p = input->str;
    const char* end = input->str + input->length;
    while (p < end) {
        const char* eol = (const char*)memchr(p, '\n', (size_t)(end - p));
        if (!eol) eol = end;

        size_t len = (size_t)(eol - p);
        if (len > 0 && p[len - 1] == '\r') len--;

        bool blank = true;
        for (size_t i = 0; i < len; i++) {
            if (p[i] != ' ' && p[i] != '\t') {
                blank = false;
                break;
            }
        }
        if (!blank) diagnostics += translate_line(opts, p, len);
        p = eol + 1;
    }
    return diagnostics;
}

static bool read_input(const char* path, StrBuf* sb) {
    if (!path) {
        return strbuf_append_file(sb, stdin);
    }
    FILE* file = fopen(path, "rb");
    if (!file) {
        log_error("cannot open '%s'", path);
        return false;
    }
    bool ok = strbuf_append_file(sb, file);
    fclose(file);
    return ok;
}

int main(int argc, char* argv[]) {
    // Initialize logging with log.conf if present
    if (access("log.conf", F_OK) == 0) {
        if (log_parse_config_file("log.conf") != LOG_OK) {
            fprintf(stderr, "Warning: Failed to parse log.conf, using defaults\n");
        }
    }
    log_init("");
    log_debug("asciimath started with %d arguments", argc);

    CliOptions opts;
    opts.input_file = NULL;
    opts.show_errors = false;
    opts.strict = false;
    std::string expression;

    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_help();
            log_finish();
            return 0;
        } else if (strcmp(argv[i], "-i") == 0 || strcmp(argv[i], "--inline") == 0) {
            opts.translate.display_inline = true;
        } else if (strcmp(argv[i], "-p") == 0 || strcmp(argv[i], "--pretty") == 0) {
            opts.translate.indent = 2;
        } else if (strcmp(argv[i], "-e") == 0 || strcmp(argv[i], "--errors") == 0) {
            opts.show_errors = true;
        } else if (strcmp(argv[i], "-s") == 0 || strcmp(argv[i], "--strict") == 0) {
            opts.strict = true;
        } else if (strcmp(argv[i], "-f") == 0 || strcmp(argv[i], "--file") == 0) {
            if (i + 1 < argc) {
                opts.input_file = argv[++i];
            } else {
                fprintf(stderr, "Error: -f option requires a file argument\n");
                log_finish();
                return 1;
            }
        } else if (argv[i][0] == '-' && argv[i][1] != '\0' && !(argv[i][1] >= '0' && argv[i][1] <= '9')) {
            fprintf(stderr, "Error: Unknown option '%s'\n", argv[i]);
            fprintf(stderr, "Use 'asciimath --help' for usage\n");
            log_finish();
            return 1;
        } else {
            // remaining words form one expression
            if (!expression.empty()) expression += ' ';
            expression += argv[i];
        }
    }

    size_t diagnostics = 0;
    if (!expression.empty()) {
        diagnostics = translate_line(opts, expression.c_str(), expression.length());
    } else {
        StrBuf* input = strbuf_new_cap(4096);
        if (!input) {
            log_error("out of memory");
            log_finish();
            return 1;
        }
        if (!read_input(opts.input_file, input)) {
            log_error("failed to read %s", opts.input_file ? opts.input_file : "stdin");
            strbuf_free(input);
            log_finish();
            return 1;
        }
        diagnostics = translate_lines(opts, input);
        strbuf_free(input);
    }

    log_debug("asciimath finished with %zu diagnostics", diagnostics);
    log_finish();
    return (opts.strict && diagnostics > 0) ? 1 : 0;
}
