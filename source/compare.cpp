// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// compare.cpp

#include <yamldiff/compare.h>
#include <yamldiff/comparator.h>
#include <yamldiff/diff_order.h>

#include <utility>

namespace yamldiff {

std::vector<Difference> compare(std::string_view from, std::string_view to, const Options& opts)
{
    auto from_docs = parse_documents(from);
    auto to_docs = parse_documents(to);
    return compare_documents(std::move(from_docs), std::move(to_docs), opts);
}

std::vector<Difference> compare_documents(DocumentList from, DocumentList to, const Options& opts)
{
    if (opts.swap) {
        std::swap(from, to);
    }

    if (!opts.chroot.empty()) {
        from = apply_chroot_to_documents(from, opts.chroot, opts.chroot_list_to_documents);
        to = apply_chroot_to_documents(to, opts.chroot, opts.chroot_list_to_documents);
    } else {
        if (!opts.chroot_from.empty()) {
            from = apply_chroot_to_documents(from, opts.chroot_from, opts.chroot_list_to_documents);
        }
        if (!opts.chroot_to.empty()) {
            to = apply_chroot_to_documents(to, opts.chroot_to, opts.chroot_list_to_documents);
        }
    }

    Comparator comparator{opts};
    comparator.compare(from, to);

    auto diffs = comparator.take_diffs();
    sort_differences(diffs, comparator.path_order());
    return diffs;
}

} // namespace yamldiff
