#pragma once

#include "dockstart_container_spec.h"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace dockstart
{

// Attribute name -> value. A key present without a value is an empty form field.
using AttributeBag = std::map<std::string, std::optional<std::string>>;

inline constexpr char kImageNameAttribute[] = "docker-image-name";
inline constexpr char kImagePortAttribute[] = "docker-image-port";
inline constexpr char kImageProtocolAttribute[] = "docker-image-protocol";
inline constexpr char kImageCmdAttribute[] = "docker-image-cmd";
inline constexpr char kImageEnvAttribute[] = "docker-image-env";
inline constexpr char kImageUserAttribute[] = "docker-image-user";
inline constexpr char kImagePasswordAttribute[] = "docker-image-password";
inline constexpr char kImageDomainAttribute[] = "docker-image-domain";

enum class EntityKind
{
    User,
    UserGroup,
    Connection
};

const char* EntityKindName(EntityKind kind);

// Whether the logged-in user may update the given entity.
using UpdatePermission = std::function<bool(EntityKind, const std::string&)>;

struct Entity
{
    EntityKind kind = EntityKind::User;
    std::string identifier;
    AttributeBag attributes;
};

/**
 * Reads a ContainerSpec out of an entity's attribute bag and hides the
 * attributes it owns from callers without update rights.
 */
class AttributeExtension
{
public:
    AttributeExtension(EntityKind kind, std::vector<std::string> recognizedKeys,
                       std::vector<std::string> requiredKeys);

    static AttributeExtension ForUser();
    static AttributeExtension ForUserGroup();
    static AttributeExtension ForConnection();

    EntityKind Kind() const
    {
        return kind_;
    }

    const std::vector<std::string>& RecognizedKeys() const
    {
        return recognizedKeys_;
    }

    bool Recognizes(const std::string& key) const;

    // True when every required key carries a non-empty value.
    bool HasContainerAssociation(const AttributeBag& attributes) const;

    /**
     * Returns std::nullopt when the bag has no container association. Throws
     * DockstartError(InvalidSpec) when a recognized value is malformed.
     */
    std::optional<ContainerSpec> Extract(const AttributeBag& attributes) const;

    // Read view: recognized keys are added empty with update rights and removed without.
    AttributeBag FilterForVisibility(AttributeBag attributes, bool canUpdate) const;

    // Write view: recognized keys are stripped without update rights.
    AttributeBag FilterWrite(AttributeBag attributes, bool canUpdate) const;

private:
    EntityKind kind_;
    std::vector<std::string> recognizedKeys_;
    std::vector<std::string> requiredKeys_;
};

using AttributeExtensions = std::vector<AttributeExtension>;

AttributeBag ApplyVisibility(const AttributeExtensions& extensions, AttributeBag attributes,
                             bool canUpdate);
AttributeBag ApplyWriteFilter(const AttributeExtensions& extensions, AttributeBag attributes,
                              bool canUpdate);

/**
 * An entity as seen by the logged-in user: attributes owned by the extensions
 * are gated by the update permission on both read and write.
 */
class AttributeView
{
public:
    AttributeView(Entity& entity, AttributeExtensions extensions, bool canUpdate);

    const std::string& Identifier() const
    {
        return entity_.identifier;
    }

    EntityKind Kind() const
    {
        return entity_.kind;
    }

    bool CanUpdate() const
    {
        return canUpdate_;
    }

    AttributeBag Attributes() const;

    // Merges the permitted part of attributes into the entity.
    void SetAttributes(const AttributeBag& attributes);

private:
    Entity& entity_;
    AttributeExtensions extensions_;
    bool canUpdate_;
};

} // namespace dockstart
