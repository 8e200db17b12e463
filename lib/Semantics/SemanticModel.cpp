//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements schema binding for resource declarations.
///
/// Every resource body is walked top-down with its expected schema type.
/// Object properties bind to schema properties by case-insensitive name, so
/// a model built over miscased input still attributes nested schema correctly.
///
//===----------------------------------------------------------------------===//

#include "llvmbicep/Semantics/SemanticModel.h"

#include "llvm/Support/FormatVariadic.h"

namespace llvmbicep
{

llvm::Expected<SemanticModel> SemanticModel::create(const Compilation&                  prior,
                                                    ProgramSyntax                       program,
                                                    std::shared_ptr<const FileResolver> fileResolver,
                                                    const Configuration&                configuration)
{
    if (program.hasErrors())
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "document has syntax errors: %s",
                                       describeFirstError(program.diagnostics).c_str());
    }
    if (!prior.catalog)
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "compilation of %s has no resource type catalog",
                                       prior.uri.c_str());
    }
    if (!fileResolver)
    {
        fileResolver = prior.fileResolver;
    }
    return analyze(std::move(program), prior.catalog, std::move(fileResolver), configuration);
}

SemanticModel SemanticModel::analyze(ProgramSyntax                              program,
                                     std::shared_ptr<const ResourceTypeCatalog> catalog,
                                     std::shared_ptr<const FileResolver>        fileResolver,
                                     const Configuration&                       configuration)
{
    SemanticModel model;
    model.program_      = std::move(program);
    model.catalog_      = std::move(catalog);
    model.fileResolver_ = std::move(fileResolver);

    DiagnosticEngine diagnostics;
    for (const auto& declaration : model.program_.declarations)
    {
        const auto* resource = declaration ? declaration->as<SyntaxNode::ResourceDeclaration>() : nullptr;
        if (!resource)
        {
            continue;
        }

        ResourceBinding binding;
        binding.declaration = declaration.get();

        const auto* typeLiteral = resource->type ? resource->type->as<SyntaxNode::StringLiteral>() : nullptr;
        if (typeLiteral)
        {
            binding.reference = ResourceTypeReference::parse(typeLiteral->value);
        }
        const TextSpan typeSpan = resource->type ? resource->type->span : declaration->span;
        if (!binding.reference)
        {
            diagnostics.error(typeSpan,
                              "BCP029",
                              "The resource type is not valid. Specify a valid resource type of format "
                              "\"<types>@<apiVersion>\".");
        }
        else
        {
            binding.bodyType = model.catalog_ ? model.catalog_->lookupBodyType(*binding.reference) : nullptr;
            if (!binding.bodyType)
            {
                diagnostics.warning(typeSpan,
                                    "BCP081",
                                    llvm::formatv("Resource type \"{0}\" does not have types available.",
                                                  binding.reference->formatName())
                                        .str());
            }
        }

        if (resource->body)
        {
            model.bindExpression(*resource->body, binding.bodyType, configuration.reportUnknownProperties, diagnostics);
        }
        model.resources_.push_back(std::move(binding));
    }

    model.diagnostics_ = diagnostics.take();
    return model;
}

void SemanticModel::bindExpression(const SyntaxNode& expression,
                                   const TypePtr&    type,
                                   bool              reportUnknown,
                                   DiagnosticEngine& diagnostics)
{
    if (type)
    {
        expressionTypes_[&expression] = type;
    }

    if (const auto* object = expression.as<SyntaxNode::ObjectExpr>())
    {
        for (const auto& property : object->properties)
        {
            const auto* entry = property ? property->as<SyntaxNode::ObjectProperty>() : nullptr;
            if (!entry || !entry->value)
            {
                continue;
            }

            TypePtr valueType;
            if (type && type->kind == TypeKind::Object)
            {
                const std::string key = propertyKeyText(*property);
                if (const TypeProperty* symbol = type->findProperty(key))
                {
                    propertySymbols_[property.get()] = symbol;
                    valueType                        = symbol->type;
                }
                else if (type->additionalProperties)
                {
                    valueType = type->additionalProperties;
                }
                else if (reportUnknown)
                {
                    diagnostics.warning(entry->key ? entry->key->span : property->span,
                                        "BCP037",
                                        llvm::formatv("The property \"{0}\" is not allowed on objects of type \"{1}\".",
                                                      key,
                                                      type->displayName())
                                            .str());
                }
            }
            bindExpression(*entry->value, valueType, reportUnknown, diagnostics);
        }
        return;
    }

    if (const auto* array = expression.as<SyntaxNode::ArrayExpr>())
    {
        const TypePtr itemType = (type && type->kind == TypeKind::Array) ? type->itemType : nullptr;
        for (const auto& item : array->items)
        {
            if (item)
            {
                bindExpression(*item, itemType, reportUnknown, diagnostics);
            }
        }
        return;
    }

    if (const auto* literal = expression.as<SyntaxNode::StringLiteral>())
    {
        if (type && type->kind == TypeKind::StringEnum)
        {
            const std::string* allowed = type->findAllowedValue(literal->value);
            if (!allowed || *allowed != literal->value)
            {
                diagnostics.warning(expression.span,
                                    "BCP036",
                                    llvm::formatv("The value '{0}' is not one of the allowed values {1}.",
                                                  literal->value,
                                                  type->displayName())
                                        .str());
            }
        }
    }
}

TypePtr SemanticModel::declaredTypeOf(const SyntaxNode& expression) const
{
    const auto it = expressionTypes_.find(&expression);
    return it == expressionTypes_.end() ? nullptr : it->second;
}

const TypeProperty* SemanticModel::propertyOf(const SyntaxNode& objectProperty) const
{
    const auto it = propertySymbols_.find(&objectProperty);
    return it == propertySymbols_.end() ? nullptr : it->second;
}

}  // namespace llvmbicep
