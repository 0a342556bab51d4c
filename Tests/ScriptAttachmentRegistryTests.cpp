#include <ECS/Public/ScriptAttachmentRegistry.hpp>
#include <ECS/Public/World.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace
{

std::vector<std::string> ids_of(const std::vector<ScriptAttachment>& attachments)
{
    std::vector<std::string> ids;
    for (const auto& attachment : attachments)
        ids.push_back(attachment.scriptId);
    return ids;
}

} // namespace

class ScriptAttachmentRegistryTest : public ::testing::Test
{
  protected:
    World world;
    ScriptAttachmentRegistry attachments{world};
    entt::entity entity = world.create_entity("Subject");
};

TEST_F(ScriptAttachmentRegistryTest, OrdersByPriorityDescending)
{
    ASSERT_TRUE(attachments.add_attachment(entity, "low", 10));
    ASSERT_TRUE(attachments.add_attachment(entity, "high", 100));
    ASSERT_TRUE(attachments.add_attachment(entity, "mid", 50));

    EXPECT_EQ(ids_of(attachments.attachments_in_order(entity)), (std::vector<std::string>{"high", "mid", "low"}));
}

TEST_F(ScriptAttachmentRegistryTest, EqualPrioritiesKeepInsertionOrder)
{
    ASSERT_TRUE(attachments.add_attachment(entity, "first", 5));
    ASSERT_TRUE(attachments.add_attachment(entity, "second", 5));
    ASSERT_TRUE(attachments.add_attachment(entity, "urgent", 9));
    ASSERT_TRUE(attachments.add_attachment(entity, "third", 5));

    EXPECT_EQ(ids_of(attachments.attachments_in_order(entity)),
              (std::vector<std::string>{"urgent", "first", "second", "third"}));
}

TEST_F(ScriptAttachmentRegistryTest, NegativePrioritiesRunLast)
{
    ASSERT_TRUE(attachments.add_attachment(entity, "cleanup", -1));
    ASSERT_TRUE(attachments.add_attachment(entity, "default"));

    EXPECT_EQ(ids_of(attachments.attachments_in_order(entity)), (std::vector<std::string>{"default", "cleanup"}));
}

TEST_F(ScriptAttachmentRegistryTest, SetActiveTogglesInPlace)
{
    ASSERT_TRUE(attachments.add_attachment(entity, "a", 3));
    ASSERT_TRUE(attachments.add_attachment(entity, "b", 2));
    ASSERT_TRUE(attachments.add_attachment(entity, "c", 1));

    EXPECT_TRUE(attachments.set_active(entity, "b", false));
    EXPECT_EQ(ids_of(attachments.active_attachments_in_order(entity)), (std::vector<std::string>{"a", "c"}));
    EXPECT_EQ(attachments.attachment_count(entity), 3u);

    EXPECT_TRUE(attachments.set_active(entity, "b", true));
    EXPECT_EQ(ids_of(attachments.active_attachments_in_order(entity)), (std::vector<std::string>{"a", "b", "c"}));

    EXPECT_FALSE(attachments.set_active(entity, "missing", false));
}

TEST_F(ScriptAttachmentRegistryTest, RejectsDuplicatesAndBadInput)
{
    ASSERT_TRUE(attachments.add_attachment(entity, "wander"));

    auto duplicate = attachments.add_attachment(entity, "wander", 7);
    ASSERT_FALSE(duplicate);
    EXPECT_EQ(duplicate.error().code, ErrorCode::ScriptAlreadyAttached);
    EXPECT_EQ(attachments.attachment_count(entity), 1u);

    auto empty = attachments.add_attachment(entity, "");
    ASSERT_FALSE(empty);
    EXPECT_EQ(empty.error().code, ErrorCode::InvalidScriptIdentifier);

    const entt::entity gone = world.create_entity("Gone");
    world.destroy_entity(gone);
    auto invalid = attachments.add_attachment(gone, "wander");
    ASSERT_FALSE(invalid);
    EXPECT_EQ(invalid.error().code, ErrorCode::InvalidEntity);
}

TEST_F(ScriptAttachmentRegistryTest, RemoveDetachesAndDropsEmptyComponent)
{
    ASSERT_TRUE(attachments.add_attachment(entity, "a"));
    ASSERT_TRUE(attachments.add_attachment(entity, "b"));
    ASSERT_EQ(world.collect_scripted_entities().size(), 1u);

    EXPECT_TRUE(attachments.remove_attachment(entity, "a"));
    EXPECT_FALSE(attachments.has_attachment(entity, "a"));
    EXPECT_TRUE(attachments.has_attachment(entity, "b"));
    EXPECT_FALSE(attachments.remove_attachment(entity, "a"));

    EXPECT_TRUE(attachments.remove_attachment(entity, "b"));
    EXPECT_EQ(attachments.attachment_count(entity), 0u);
    EXPECT_TRUE(world.collect_scripted_entities().empty());
}

TEST_F(ScriptAttachmentRegistryTest, ReattachedScriptGoesToTheBackOfItsPriority)
{
    ASSERT_TRUE(attachments.add_attachment(entity, "a"));
    ASSERT_TRUE(attachments.add_attachment(entity, "b"));
    ASSERT_TRUE(attachments.remove_attachment(entity, "a"));
    ASSERT_TRUE(attachments.add_attachment(entity, "a"));

    EXPECT_EQ(ids_of(attachments.attachments_in_order(entity)), (std::vector<std::string>{"b", "a"}));
}

TEST_F(ScriptAttachmentRegistryTest, AttachmentsArePerEntity)
{
    const entt::entity other = world.create_entity("Other");
    ASSERT_TRUE(attachments.add_attachment(entity, "wander"));
    ASSERT_TRUE(attachments.add_attachment(other, "wander"));
    ASSERT_TRUE(attachments.set_active(other, "wander", false));

    EXPECT_EQ(attachments.active_attachments_in_order(entity).size(), 1u);
    EXPECT_TRUE(attachments.active_attachments_in_order(other).empty());
    EXPECT_EQ(world.collect_scripted_entities().size(), 2u);
}

TEST_F(ScriptAttachmentRegistryTest, DestroyedEntityHasNoAttachments)
{
    ASSERT_TRUE(attachments.add_attachment(entity, "wander"));
    world.destroy_entity(entity);

    EXPECT_FALSE(attachments.has_attachment(entity, "wander"));
    EXPECT_TRUE(attachments.attachments_in_order(entity).empty());
    EXPECT_FALSE(attachments.remove_attachment(entity, "wander"));
    EXPECT_TRUE(world.collect_scripted_entities().empty());
}
