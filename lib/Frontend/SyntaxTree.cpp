//===----------------------------------------------------------------------===//
//
// Part of the fabls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements generic document-order traversal over the opaque tree interface.
///
//===----------------------------------------------------------------------===//

#include "fabls/Frontend/SyntaxTree.h"

namespace fabls
{

llvm::Error walkInDocumentOrder(const SyntaxNode& root, llvm::function_ref<llvm::Error(const SyntaxNode&)> visit)
{
    if (llvm::Error error = visit(root))
    {
        return error;
    }
    for (std::size_t i = 0; i < root.childCount(); ++i)
    {
        const SyntaxNode* child = root.child(i);
        if (!child)
        {
            continue;
        }
        if (llvm::Error error = walkInDocumentOrder(*child, visit))
        {
            return error;
        }
    }
    return llvm::Error::success();
}

const SyntaxNode* descendantForPoint(const SyntaxNode& root, const SourcePoint& point)
{
    if (!root.range().covers(point))
    {
        return nullptr;
    }

    const SyntaxNode* current = &root;
    while (true)
    {
        const SyntaxNode* next = nullptr;
        for (std::size_t i = 0; i < current->childCount(); ++i)
        {
            const SyntaxNode* child = current->child(i);
            if (child && child->range().covers(point))
            {
                next = child;
                break;
            }
        }
        if (!next)
        {
            return current;
        }
        current = next;
    }
}

}  // namespace fabls
