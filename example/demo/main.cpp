// main.cpp - yamldiff demo
//
// Usage:
//   yamldiff_demo [options] <from.yaml> <to.yaml>
//   yamldiff_demo               (runs the built-in sample)
//
// Options:
//   -k  detect Kubernetes resources      -r  detect renamed resources
//   -o  ignore list order                -w  ignore whitespace changes
//   -v  ignore value changes             -s  swap from/to
//   -d  dump the parsed documents first
//   --id=FIELD        additional list identifier (repeatable)
//   --chroot=PATH     compare only the subtree at PATH
//   --include=PATH    report only differences under PATH (repeatable)
//   --exclude=PATH    drop differences under PATH (repeatable)

#include <yamldiff/compare.h>
#include <yamldiff/filter.h>

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace yamldiff;

namespace {

constexpr std::string_view kSampleFrom = R"(apiVersion: apps/v1
kind: Deployment
metadata:
  name: web
spec:
  replicas: 2
  template:
    spec:
      containers:
      - name: nginx
        image: nginx:1.25
      - name: sidecar
        image: envoy:1.29
)";

constexpr std::string_view kSampleTo = R"(apiVersion: apps/v1
kind: Deployment
metadata:
  name: web
  labels:
    tier: frontend
spec:
  replicas: 3
  template:
    spec:
      containers:
      - name: sidecar
        image: envoy:1.30
      - name: nginx
        image: nginx:1.25
)";

std::string read_file(const std::string& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("cannot open " + path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

bool consume_prefixed(std::string_view arg, std::string_view prefix, std::string& out)
{
    if (!arg.starts_with(prefix)) {
        return false;
    }
    out = std::string(arg.substr(prefix.size()));
    return true;
}

void dump_documents(std::string_view label, const DocumentList& docs)
{
    std::cout << "=== " << label << " ===\n";
    for (std::size_t i = 0; i < docs.size(); ++i) {
        std::cout << "--- [" << i << "]\n";
        print_node(docs[i], "", 1);
    }
    std::cout << "\n";
}

void print_differences(const std::vector<Difference>& diffs)
{
    if (diffs.empty()) {
        std::cout << "  (no changes)\n";
        return;
    }
    std::size_t current_doc = diffs.front().document_index;
    for (const auto& d : diffs) {
        if (d.document_index != current_doc) {
            current_doc = d.document_index;
            std::cout << "  ---\n";
        }
        std::cout << "  " << to_string(d) << "\n";
    }
}

} // anonymous namespace

int main(int argc, char* argv[])
{
    Options opts;
    FilterOptions filter;
    std::vector<std::string> files;
    bool dump = false;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        std::string value;
        if (arg == "-k") {
            opts.detect_kubernetes = true;
        } else if (arg == "-r") {
            opts.detect_renames = true;
        } else if (arg == "-o") {
            opts.ignore_order_changes = true;
        } else if (arg == "-w") {
            opts.ignore_whitespace_changes = true;
        } else if (arg == "-v") {
            opts.ignore_value_changes = true;
        } else if (arg == "-s") {
            opts.swap = true;
        } else if (arg == "-d") {
            dump = true;
        } else if (consume_prefixed(arg, "--id=", value)) {
            opts.additional_identifiers.push_back(value);
        } else if (consume_prefixed(arg, "--chroot=", value)) {
            opts.chroot = value;
        } else if (consume_prefixed(arg, "--include=", value)) {
            filter.include_paths.push_back(value);
        } else if (consume_prefixed(arg, "--exclude=", value)) {
            filter.exclude_paths.push_back(value);
        } else if (arg.starts_with("-")) {
            std::cerr << "unknown option: " << arg << "\n";
            return 2;
        } else {
            files.emplace_back(arg);
        }
    }

    if (!files.empty() && files.size() != 2) {
        std::cerr << "usage: yamldiff_demo [options] <from.yaml> <to.yaml>\n";
        return 2;
    }

    try {
        std::string from_text;
        std::string to_text;
        if (files.empty()) {
            std::cout << "=== yamldiff sample (Kubernetes Deployment) ===\n\n";
            opts.detect_kubernetes = true;
            from_text = kSampleFrom;
            to_text = kSampleTo;
        } else {
            from_text = read_file(files[0]);
            to_text = read_file(files[1]);
        }

        auto from_docs = parse_documents(from_text);
        auto to_docs = parse_documents(to_text);
        if (dump) {
            dump_documents("from", from_docs);
            dump_documents("to", to_docs);
        }

        auto diffs = filter_differences(compare_documents(std::move(from_docs), std::move(to_docs), opts), filter);
        print_differences(diffs);
        return diffs.empty() ? 0 : 1;
    } catch (const ParseError& e) {
        std::cerr << "parse error: " << e.what() << "\n";
    } catch (const ChrootError& e) {
        std::cerr << "chroot error: " << e.what() << "\n";
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
    }
    return 255;
}
