#include <gtest/gtest.h>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <mutex>

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>

import Graphics;
import RHI;
import Core;

#include "MockDevice.h"

using namespace Graphics;

namespace
{
    glm::mat4 Translation(float x, float y, float z)
    {
        return glm::translate(glm::mat4(1.0f), glm::vec3(x, y, z));
    }

    void AddInstances(Model& model, uint32_t count)
    {
        std::lock_guard lock(model.Mutex);
        for (uint32_t i = 0; i < count; ++i)
        {
            const InstanceId id = model.NewInstance();
            ASSERT_TRUE(model.UpdateInstance(id, Translation(static_cast<float>(id), 0.0f, 0.0f)).has_value());
        }
    }

    InstanceRecord ReadRecord(const RHI::Buffer& buffer, size_t index)
    {
        InstanceRecord record;
        std::memcpy(&record, Testing::AsMock(buffer).Bytes.data() + index * sizeof(InstanceRecord),
                    sizeof(InstanceRecord));
        return record;
    }
}

// -----------------------------------------------------------------------------
// Model instances
// -----------------------------------------------------------------------------

TEST(GraphicsModel, InstanceRecordIsTightlyPacked)
{
    EXPECT_EQ(sizeof(InstanceRecord), 100u);
}

TEST(GraphicsModel, NewInstanceIsIdentity)
{
    Model model("Cube");
    const InstanceId first = model.NewInstance();
    const InstanceId second = model.NewInstance();

    EXPECT_EQ(first, 0u);
    EXPECT_EQ(second, 1u);
    EXPECT_EQ(model.Instances[1].Model, glm::mat4(1.0f));
    EXPECT_EQ(model.Instances[1].Normal, glm::mat3(1.0f));
    EXPECT_EQ(model.GetRequiredBufferSize(), 200u);
}

TEST(GraphicsModel, UpdateOutOfRangeFails)
{
    Model model("Cube");
    (void)model.NewInstance();

    auto result = model.UpdateInstance(1, glm::mat4(1.0f));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), Core::ErrorCode::OutOfRange);
}

TEST(GraphicsModel, NormalMatrixIsInverseTranspose)
{
    Model model("Cube");
    const InstanceId id = model.NewInstance();
    const glm::mat4 scale = glm::scale(glm::mat4(1.0f), glm::vec3(2.0f, 4.0f, 1.0f));
    ASSERT_TRUE(model.UpdateInstance(id, Translation(5.0f, 0.0f, 0.0f) * scale).has_value());

    const glm::mat3& normal = model.Instances[id].Normal;
    EXPECT_FLOAT_EQ(normal[0][0], 0.5f);
    EXPECT_FLOAT_EQ(normal[1][1], 0.25f);
    EXPECT_FLOAT_EQ(normal[2][2], 1.0f);
    EXPECT_FLOAT_EQ(model.Instances[id].Model[3][0], 5.0f);
}

TEST(GraphicsModel, SingularTransformFallsBackToIdentityNormal)
{
    Model model("Flat");
    const InstanceId id = model.NewInstance();
    const glm::mat4 flatten = glm::scale(glm::mat4(1.0f), glm::vec3(1.0f, 0.0f, 1.0f));

    ASSERT_TRUE(model.UpdateInstance(id, flatten).has_value());
    EXPECT_EQ(model.Instances[id].Normal, glm::mat3(1.0f));
    EXPECT_EQ(model.Instances[id].Model, flatten);

    bool singular = false;
    (void)ComputeNormalMatrix(flatten, &singular);
    EXPECT_TRUE(singular);
}

// -----------------------------------------------------------------------------
// Instance buffer sync
// -----------------------------------------------------------------------------

TEST(InstanceSync, FirstSyncAllocatesWithRecords)
{
    Testing::MockDevice device;
    Model model("Cube");
    AddInstances(model, 3);

    ASSERT_TRUE(SyncInstanceBuffer(model, device).has_value());
    ASSERT_NE(model.InstanceBuffer, nullptr);
    EXPECT_EQ(device.BuffersCreated, 1u);
    EXPECT_EQ(model.InstanceBuffer->GetSizeBytes(), 300u);
    EXPECT_EQ(model.InstanceBuffer->GetUsage(), RHI::BufferUsage::Vertex);
    EXPECT_FLOAT_EQ(ReadRecord(*model.InstanceBuffer, 2).Model[3][0], 2.0f);
}

TEST(InstanceSync, SameCountRewritesInPlace)
{
    Testing::MockDevice device;
    Model model("Cube");
    AddInstances(model, 2);
    ASSERT_TRUE(SyncInstanceBuffer(model, device).has_value());
    const RHI::Buffer* before = model.InstanceBuffer.get();

    {
        std::lock_guard lock(model.Mutex);
        ASSERT_TRUE(model.UpdateInstance(1, Translation(0.0f, 7.0f, 0.0f)).has_value());
    }
    ASSERT_TRUE(SyncInstanceBuffer(model, device).has_value());

    EXPECT_EQ(model.InstanceBuffer.get(), before);
    EXPECT_EQ(device.BuffersCreated, 1u);
    EXPECT_EQ(device.BufferWrites, 1u);
    EXPECT_FLOAT_EQ(ReadRecord(*model.InstanceBuffer, 1).Model[3][1], 7.0f);
}

TEST(InstanceSync, GrowingReallocatesAndKeepsExistingRecords)
{
    Testing::MockDevice device;
    Model model("Cube");
    AddInstances(model, 4);
    ASSERT_TRUE(SyncInstanceBuffer(model, device).has_value());
    const auto oldBytes = Testing::AsMock(*model.InstanceBuffer).Bytes;

    AddInstances(model, 1);
    ASSERT_TRUE(SyncInstanceBuffer(model, device).has_value());

    const auto& newBytes = Testing::AsMock(*model.InstanceBuffer).Bytes;
    EXPECT_EQ(device.BuffersCreated, 2u);
    EXPECT_EQ(Testing::AsMock(*model.InstanceBuffer).Serial, 2u);
    ASSERT_EQ(newBytes.size(), 5 * sizeof(InstanceRecord));
    EXPECT_EQ(std::memcmp(newBytes.data(), oldBytes.data(), oldBytes.size()), 0);
    EXPECT_FLOAT_EQ(ReadRecord(*model.InstanceBuffer, 4).Model[3][0], 4.0f);
}

TEST(InstanceSync, NoInstancesReleasesBuffer)
{
    Testing::MockDevice device;
    Model model("Cube");
    AddInstances(model, 1);
    ASSERT_TRUE(SyncInstanceBuffer(model, device).has_value());

    model.Instances.clear();
    ASSERT_TRUE(SyncInstanceBuffer(model, device).has_value());
    EXPECT_EQ(model.InstanceBuffer, nullptr);

    // Still nothing to upload.
    ASSERT_TRUE(SyncInstanceBuffer(model, device).has_value());
    EXPECT_EQ(device.BuffersCreated, 1u);
}

TEST(InstanceSync, AllocationFailureKeepsOldBuffer)
{
    Testing::MockDevice device;
    Model model("Cube");
    AddInstances(model, 1);
    ASSERT_TRUE(SyncInstanceBuffer(model, device).has_value());
    const RHI::Buffer* before = model.InstanceBuffer.get();

    AddInstances(model, 1);
    device.FailBuffers = true;
    auto result = SyncInstanceBuffer(model, device);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), Core::ErrorCode::OutOfDeviceMemory);
    EXPECT_EQ(model.InstanceBuffer.get(), before);
}

TEST(InstanceSync, WriteFailureIsReported)
{
    Testing::MockDevice device;
    Model model("Cube");
    AddInstances(model, 1);
    ASSERT_TRUE(SyncInstanceBuffer(model, device).has_value());

    device.FailBuffers = true;
    auto result = SyncInstanceBuffer(model, device);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), Core::ErrorCode::OutOfDeviceMemory);
}
