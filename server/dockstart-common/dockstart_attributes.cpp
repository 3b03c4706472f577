#include "dockstart_attributes.h"

#include "dockstart_errors.h"

#include <algorithm>
#include <numeric>
#include <utility>

namespace dockstart
{
namespace
{
std::optional<std::string> NonEmptyValue(const AttributeBag& attributes, const std::string& key)
{
    const auto it = attributes.find(key);
    if (it == attributes.end() || !it->second || it->second->empty())
        return std::nullopt;
    return it->second;
}
} // namespace

const char* EntityKindName(EntityKind kind)
{
    switch (kind)
    {
    case EntityKind::User:
        return "user";
    case EntityKind::UserGroup:
        return "user group";
    case EntityKind::Connection:
        return "connection";
    }
    return "entity";
}

AttributeExtension::AttributeExtension(EntityKind kind, std::vector<std::string> recognizedKeys,
                                       std::vector<std::string> requiredKeys)
    : kind_(kind), recognizedKeys_(std::move(recognizedKeys)), requiredKeys_(std::move(requiredKeys))
{
}

AttributeExtension AttributeExtension::ForUser()
{
    return AttributeExtension(EntityKind::User,
                              {kImageNameAttribute, kImagePortAttribute, kImageProtocolAttribute,
                               kImageCmdAttribute, kImageEnvAttribute, kImageUserAttribute,
                               kImagePasswordAttribute, kImageDomainAttribute},
                              {kImageNameAttribute, kImagePortAttribute, kImageProtocolAttribute});
}

AttributeExtension AttributeExtension::ForUserGroup()
{
    return AttributeExtension(EntityKind::UserGroup,
                              {kImageNameAttribute, kImagePortAttribute, kImageProtocolAttribute,
                               kImageCmdAttribute, kImageEnvAttribute},
                              {kImageNameAttribute, kImagePortAttribute, kImageProtocolAttribute});
}

// The protocol of a connection is its own, not an attribute.
AttributeExtension AttributeExtension::ForConnection()
{
    return AttributeExtension(EntityKind::Connection,
                              {kImageNameAttribute, kImagePortAttribute, kImageCmdAttribute,
                               kImageEnvAttribute},
                              {kImageNameAttribute, kImagePortAttribute});
}

bool AttributeExtension::Recognizes(const std::string& key) const
{
    return std::find(recognizedKeys_.begin(), recognizedKeys_.end(), key) != recognizedKeys_.end();
}

bool AttributeExtension::HasContainerAssociation(const AttributeBag& attributes) const
{
    return std::all_of(requiredKeys_.begin(), requiredKeys_.end(), [&](const std::string& key) {
        return NonEmptyValue(attributes, key).has_value();
    });
}

std::optional<ContainerSpec> AttributeExtension::Extract(const AttributeBag& attributes) const
{
    if (!HasContainerAssociation(attributes))
        return std::nullopt;

    // Keys this variant does not recognize are ignored even when present.
    const auto value = [&](const char* key) -> std::optional<std::string> {
        if (!Recognizes(key))
            return std::nullopt;
        return NonEmptyValue(attributes, key);
    };

    ContainerSpec spec;
    spec.image = *value(kImageNameAttribute);

    const std::string portText = *value(kImagePortAttribute);
    spec.internalPort = ParsePort(portText);
    if (!spec.internalPort)
        throw DockstartError(ErrorCode::InvalidSpec,
                             std::string(kImagePortAttribute) + "='" + portText + "'");

    if (const auto protocolText = value(kImageProtocolAttribute))
    {
        spec.protocol = ParseProtocol(*protocolText);
        if (!spec.protocol)
            throw DockstartError(ErrorCode::InvalidSpec,
                                 std::string(kImageProtocolAttribute) + "='" + *protocolText + "'");
    }

    spec.command = value(kImageCmdAttribute);
    if (const auto env = value(kImageEnvAttribute))
        spec.environment = ParseEnvironment(*env);

    spec.credentials.username = value(kImageUserAttribute);
    spec.credentials.password = value(kImagePasswordAttribute);
    spec.credentials.domain = value(kImageDomainAttribute);

    return spec;
}

AttributeBag AttributeExtension::FilterForVisibility(AttributeBag attributes, bool canUpdate) const
{
    for (const auto& key : recognizedKeys_)
    {
        if (canUpdate)
            attributes.emplace(key, std::nullopt);
        else
            attributes.erase(key);
    }
    return attributes;
}

AttributeBag AttributeExtension::FilterWrite(AttributeBag attributes, bool canUpdate) const
{
    if (canUpdate)
        return attributes;

    for (const auto& key : recognizedKeys_)
        attributes.erase(key);
    return attributes;
}

AttributeBag ApplyVisibility(const AttributeExtensions& extensions, AttributeBag attributes,
                             bool canUpdate)
{
    return std::accumulate(extensions.begin(), extensions.end(), std::move(attributes),
                           [canUpdate](AttributeBag bag, const AttributeExtension& extension) {
                               return extension.FilterForVisibility(std::move(bag), canUpdate);
                           });
}

AttributeBag ApplyWriteFilter(const AttributeExtensions& extensions, AttributeBag attributes,
                              bool canUpdate)
{
    return std::accumulate(extensions.begin(), extensions.end(), std::move(attributes),
                           [canUpdate](AttributeBag bag, const AttributeExtension& extension) {
                               return extension.FilterWrite(std::move(bag), canUpdate);
                           });
}

AttributeView::AttributeView(Entity& entity, AttributeExtensions extensions, bool canUpdate)
    : entity_(entity), extensions_(std::move(extensions)), canUpdate_(canUpdate)
{
}

AttributeBag AttributeView::Attributes() const
{
    return ApplyVisibility(extensions_, entity_.attributes, canUpdate_);
}

void AttributeView::SetAttributes(const AttributeBag& attributes)
{
    for (auto& entry : ApplyWriteFilter(extensions_, attributes, canUpdate_))
        entity_.attributes[entry.first] = std::move(entry.second);
}

} // namespace dockstart
