// SPDX-License-Identifier: Apache-2.0
#include "StripRewriter.hpp"

// Removes ghost and tracked fields from structs and enum variants. Names of removed fields are
// recorded so struct literals can be fixed up later.
class FieldRemover : public StripRewriter<FieldRemover> {
   public:
    using StripRewriter::StripRewriter;

    ShouldVisitChildren handle(StructDeclarationSyntax& node) {
        if (!node.fields)
            return DONT_VISIT_CHILDREN;
        std::string name(node.name->token.text);
        auto& removedNames = context.removedFields[name];
        if (removeGhostFields(*node.fields, removedNames))
            warnIfEmpty(*node.fields, "struct '" + name + "'");
        return DONT_VISIT_CHILDREN;
    }

    ShouldVisitChildren handle(EnumVariantSyntax& node) {
        if (!node.fields)
            return DONT_VISIT_CHILDREN;
        auto& removedNames = context.removedFields[variantKey(node)];
        if (removeGhostFields(*node.fields, removedNames))
            warnIfEmpty(*node.fields, "enum variant '" + std::string(node.name->token.text) + "'");
        return DONT_VISIT_CHILDREN;
    }

   private:
    // Enum::Variant, the form struct literals of the variant are written in
    static std::string variantKey(EnumVariantSyntax& node) {
        std::string variant(node.name->token.text);
        SyntaxNode* list = node.parent;
        if (list && list->parent && list->parent->kind == SyntaxKind::EnumDeclaration)
            return std::string(list->parent->as<EnumDeclarationSyntax>().name->token.text) +
                   "::" + variant;
        return variant;
    }

    size_t removeGhostFields(DelimitedListSyntax& fields, flat_hash_set<std::string>& removedNames) {
        return removeListElements(fields, [&](SyntaxNode& element) {
            auto& field = element.as<FieldSyntax>();
            if (field.qualifier == Qualifier::Executable)
                return false;
            if (field.name)
                removedNames.emplace(field.name->token.text);
            return true;
        });
    }

    void warnIfEmpty(DelimitedListSyntax& fields, const std::string& what) {
        if (!fields.elements().empty())
            return;
        auto& sm = tree.sourceManager();
        context.warnings.push_back("line " +
                                   std::to_string(sm.getLineNumber(fields.open->token.location)) +
                                   ": " + what + " has no fields left after stripping");
    }
};

template void rewriteStage<FieldRemover>(SyntaxTree& tree,
                                         StripContext& context,
                                         const std::string& stageName);
