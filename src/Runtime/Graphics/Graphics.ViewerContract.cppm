module;
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

#include <glm/glm.hpp>

export module Graphics:ViewerContract;

import RHI;
import :BindingLayout;
import :Model;

export namespace Graphics::ViewerContract
{
    inline constexpr uint32_t kMaterialGroup = 0;
    inline constexpr uint32_t kCameraGroup = 1;
    inline constexpr uint32_t kLightGroup = 2;

    // Mesh vertex stream (binding 0).
    struct Vertex
    {
        glm::vec3 Position;
        glm::vec2 UV;
        glm::vec3 Normal;
        glm::vec3 Tangent;
        glm::vec3 Bitangent;
    };

    struct CameraUniform
    {
        glm::mat4 ViewProjection{1.0f};
        glm::vec4 ViewPosition{0.0f};
    };

    struct LightUniform
    {
        glm::vec4 Position{0.0f};
        glm::vec4 Color{1.0f};
    };

    // The binding groups the viewer binds at draw time:
    //   group 0  material: diffuse texture/sampler, normal texture/sampler (fragment)
    //   group 1  camera uniform (vertex | fragment)
    //   group 2  light uniform (vertex | fragment)
    [[nodiscard]] inline std::vector<BindingGroupLayout> ExpectedLayout()
    {
        using RHI::ShaderStageFlags;

        BindingGroupLayout material;
        material.Label = "Material";
        material.Entries = {
            MakeTexture(0, ShaderStageFlags::Fragment),
            MakeSampler(1, ShaderStageFlags::Fragment),
            MakeTexture(2, ShaderStageFlags::Fragment),
            MakeSampler(3, ShaderStageFlags::Fragment),
        };

        BindingGroupLayout camera;
        camera.Label = "Camera";
        camera.Entries = {MakeUniformBuffer(0, ShaderStageFlags::VertexFragment)};

        BindingGroupLayout light;
        light.Label = "Light";
        light.Entries = {MakeUniformBuffer(0, ShaderStageFlags::VertexFragment)};

        return {material, camera, light};
    }

    // Binding 0: per-vertex mesh data (locations 0..4).
    // Binding 1: per-instance InstanceRecord (locations 5..11).
    [[nodiscard]] inline std::vector<RHI::VertexBufferLayout> VertexBuffers()
    {
        RHI::VertexBufferLayout mesh;
        mesh.Stride = sizeof(Vertex);
        mesh.StepMode = RHI::VertexStepMode::Vertex;
        mesh.Attributes = {
            {0, RHI::Format::R32G32B32_SFLOAT, offsetof(Vertex, Position)},
            {1, RHI::Format::R32G32_SFLOAT, offsetof(Vertex, UV)},
            {2, RHI::Format::R32G32B32_SFLOAT, offsetof(Vertex, Normal)},
            {3, RHI::Format::R32G32B32_SFLOAT, offsetof(Vertex, Tangent)},
            {4, RHI::Format::R32G32B32_SFLOAT, offsetof(Vertex, Bitangent)},
        };

        RHI::VertexBufferLayout instance;
        instance.Stride = sizeof(InstanceRecord);
        instance.StepMode = RHI::VertexStepMode::Instance;
        for (uint32_t column = 0; column < 4; ++column)
        {
            instance.Attributes.push_back({5 + column, RHI::Format::R32G32B32A32_SFLOAT,
                                           static_cast<uint32_t>(offsetof(InstanceRecord, Model) + column * 16)});
        }
        for (uint32_t column = 0; column < 3; ++column)
        {
            instance.Attributes.push_back({9 + column, RHI::Format::R32G32B32_SFLOAT,
                                           static_cast<uint32_t>(offsetof(InstanceRecord, Normal) + column * 12)});
        }

        return {mesh, instance};
    }

    // Built-in shader that satisfies ExpectedLayout() and VertexBuffers().
    [[nodiscard]] inline std::string_view DefaultShaderSource()
    {
        return R"glsl(#version 450

layout(set = 1, binding = 0) uniform CameraUniform
{
    mat4 ViewProjection;
    vec4 ViewPosition;
} camera;

layout(set = 2, binding = 0) uniform LightUniform
{
    vec4 Position;
    vec4 Color;
} light;

#pragma shader_stage(vertex)
layout(location = 0) in vec3 inPosition;
layout(location = 1) in vec2 inUV;
layout(location = 2) in vec3 inNormal;
layout(location = 3) in vec3 inTangent;
layout(location = 4) in vec3 inBitangent;
layout(location = 5) in vec4 inModel0;
layout(location = 6) in vec4 inModel1;
layout(location = 7) in vec4 inModel2;
layout(location = 8) in vec4 inModel3;
layout(location = 9) in vec3 inNormalMatrix0;
layout(location = 10) in vec3 inNormalMatrix1;
layout(location = 11) in vec3 inNormalMatrix2;

layout(location = 0) out vec2 vUV;
layout(location = 1) out vec3 vWorldPosition;
layout(location = 2) out mat3 vTBN;

void main()
{
    mat4 model = mat4(inModel0, inModel1, inModel2, inModel3);
    mat3 normalMatrix = mat3(inNormalMatrix0, inNormalMatrix1, inNormalMatrix2);

    vec4 world = model * vec4(inPosition, 1.0);
    vWorldPosition = world.xyz;
    vUV = inUV;
    vTBN = mat3(normalize(normalMatrix * inTangent),
                normalize(normalMatrix * inBitangent),
                normalize(normalMatrix * inNormal));

    gl_Position = camera.ViewProjection * world;
}

#pragma shader_stage(fragment)
layout(set = 0, binding = 0) uniform texture2D diffuseTexture;
layout(set = 0, binding = 1) uniform sampler diffuseSampler;
layout(set = 0, binding = 2) uniform texture2D normalTexture;
layout(set = 0, binding = 3) uniform sampler normalSampler;

layout(location = 0) in vec2 vUV;
layout(location = 1) in vec3 vWorldPosition;
layout(location = 2) in mat3 vTBN;

layout(location = 0) out vec4 outColor;

void main()
{
    vec3 albedo = texture(sampler2D(diffuseTexture, diffuseSampler), vUV).rgb;
    vec3 tangentNormal = texture(sampler2D(normalTexture, normalSampler), vUV).xyz * 2.0 - 1.0;
    vec3 N = normalize(vTBN * tangentNormal);

    vec3 L = normalize(light.Position.xyz - vWorldPosition);
    vec3 V = normalize(camera.ViewPosition.xyz - vWorldPosition);
    vec3 H = normalize(L + V);

    float diffuse = max(dot(N, L), 0.0);
    float specular = pow(max(dot(N, H), 0.0), 32.0);
    vec3 ambient = 0.05 * albedo;

    outColor = vec4(ambient + (albedo * diffuse + vec3(specular)) * light.Color.rgb, 1.0);
}
)glsl";
    }
}
