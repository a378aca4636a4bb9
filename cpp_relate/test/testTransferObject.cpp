#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>

#include "cpp_relate/src/cpp_relate/DBDatabase.hpp"
#include "cpp_relate/src/cpp_relate/DBErrors.hpp"
#include "cpp_relate/src/cpp_relate/DBTransferObject.hpp"
#include "cpp_relate/src/utils/Logger.hpp"

using namespace std::string_literals;

using cpp_relate::AttributeType;

// Test structures for typed records
struct Video : public cpp_relate::BaseTransferObject
{
  std::string title;
  std::string engine;
  int32_t duration{0};
  bool hd{false};
  double rating{0.0};
};

BOOST_DESCRIBE_STRUCT(Video,
                      (cpp_relate::BaseTransferObject),
                      (title, engine, duration, hd, rating));

struct User : public cpp_relate::BaseTransferObject
{
  std::string name;
  cpp_relate::ForeignKey<Video> favorite;  // Lazy FK, column favorite_id
};

BOOST_DESCRIBE_STRUCT(User, (cpp_relate::BaseTransferObject), (name, favorite));

static_assert(cpp_relate::IsForeignKey<cpp_relate::ForeignKey<Video>>);
static_assert(!cpp_relate::IsForeignKey<Video>);
static_assert(std::is_same_v<cpp_relate::ForeignKeyType<decltype(User::favorite)>,
                             Video>);

class TransferObjectTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    cpp_relate::Logger::getInstance().configure(
      "test_cpp_relate_transfer", "", spdlog::level::debug);

    db_ = std::make_unique<cpp_relate::Database>(
      ":memory:", cpp_relate::Logger::getInstance().getLogger());
    cpp_relate::defineKindOf<Video>(*db_);
    cpp_relate::defineKindOf<User>(*db_);
  }

  Video makeVideo(const std::string& title, int32_t duration)
  {
    Video video;
    video.title = title;
    video.engine = "youtube";
    video.duration = duration;
    video.hd = duration > 100;
    video.rating = 4.5;
    return video;
  }

  std::unique_ptr<cpp_relate::Database> db_;
};

TEST_F(TransferObjectTest, DescribeKindFromMembers)
{
  auto kind = cpp_relate::describeKind<Video>();

  EXPECT_EQ(kind.name, "Video");
  ASSERT_EQ(kind.attributes.size(), 5);
  EXPECT_EQ(kind.attributes[0].name, "title");
  EXPECT_EQ(kind.attributes[0].type, AttributeType::TEXT);
  EXPECT_EQ(kind.attributes[2].name, "duration");
  EXPECT_EQ(kind.attributes[2].type, AttributeType::INT);
  EXPECT_EQ(kind.attributes[3].type, AttributeType::BOOL);
  EXPECT_EQ(kind.attributes[4].type, AttributeType::FLOAT);
  EXPECT_TRUE(kind.attributes[4].required);

  auto user = cpp_relate::describeKind<User>();
  EXPECT_EQ(user.name, "User");
  ASSERT_EQ(user.attributes.size(), 2);
  EXPECT_EQ(user.attributes[1].name, "favorite_id");
  EXPECT_EQ(user.attributes[1].type, AttributeType::INT);
  EXPECT_FALSE(user.attributes[1].required);

  // Already defined by SetUp
  EXPECT_THROW(cpp_relate::defineKindOf<Video>(*db_),
               cpp_relate::DuplicateKindError);
}

TEST_F(TransferObjectTest, InsertAndReadObjects)
{
  Video cat = makeVideo("Cat", 90);
  Video dog = makeVideo("Dog", 120);

  cpp_relate::insertObject(*db_, cat);
  auto dogRecord = cpp_relate::insertObject(*db_, dog);

  EXPECT_EQ(cat.id, 1);
  EXPECT_EQ(dog.id, 2);
  EXPECT_EQ(dogRecord.getAs<int64_t>("duration"), 120);
  EXPECT_TRUE(dogRecord.getAs<bool>("hd"));

  auto loaded = cpp_relate::getObject<Video>(*db_, dog.id);
  EXPECT_EQ(loaded.id, dog.id);
  EXPECT_EQ(loaded.title, "Dog");
  EXPECT_EQ(loaded.engine, "youtube");
  EXPECT_EQ(loaded.duration, 120);
  EXPECT_TRUE(loaded.hd);
  EXPECT_DOUBLE_EQ(loaded.rating, 4.5);

  auto all = cpp_relate::allObjects<Video>(*db_);
  ASSERT_EQ(all.size(), 2);
  EXPECT_EQ(all[0].title, "Cat");
  EXPECT_EQ(all[1].title, "Dog");

  EXPECT_FALSE(cpp_relate::findObject<Video>(*db_, 99).has_value());
  EXPECT_THROW(cpp_relate::getObject<Video>(*db_, 99), cpp_relate::NotFoundError);

  // A record of another kind cannot be read as a Video
  User user;
  user.name = "ada";
  auto userRecord = cpp_relate::insertObject(*db_, user);
  EXPECT_THROW(cpp_relate::toObject<Video>(userRecord),
               cpp_relate::ValidationError);
}

TEST_F(TransferObjectTest, ForeignKeyLazyLoading)
{
  Video cat = makeVideo("Cat", 90);
  cpp_relate::insertObject(*db_, cat);

  User user;
  user.name = "ada";
  user.favorite = cat.id;
  cpp_relate::insertObject(*db_, user);

  auto loaded = cpp_relate::getObject<User>(*db_, user.id);
  EXPECT_EQ(loaded.name, "ada");

  // Only the id is loaded until the key is resolved
  EXPECT_TRUE(loaded.favorite.isSet());
  EXPECT_EQ(loaded.favorite.id, cat.id);
  EXPECT_FALSE(loaded.favorite.data_.has_value());

  auto favorite = loaded.favorite.resolve(*db_);
  ASSERT_TRUE(favorite.has_value()) << "ForeignKey should resolve to video";
  EXPECT_EQ(favorite->get().title, "Cat");
  EXPECT_EQ(favorite->get().duration, 90);

  // Re-pointing the key drops the loaded object
  loaded.favorite = 99;
  EXPECT_FALSE(loaded.favorite.data_.has_value());
  EXPECT_FALSE(loaded.favorite.resolve(*db_).has_value())
    << "Dangling FK should not resolve";
}

TEST_F(TransferObjectTest, ForeignKeyNullReference)
{
  User user;
  user.name = "grace";
  auto record = cpp_relate::insertObject(*db_, user);

  EXPECT_TRUE(record.isNull("favorite_id"));

  auto loaded = cpp_relate::getObject<User>(*db_, user.id);
  EXPECT_FALSE(loaded.favorite.isSet());
  EXPECT_FALSE(loaded.favorite.resolve(*db_).has_value())
    << "Unset FK should not resolve";
}

TEST_F(TransferObjectTest, ForeignKeyBacksAssociation)
{
  db_->defineAssociation(
    "User",
    "favorite",
    cpp_relate::AssociationDefinition::oneToOne("Video", "favorite_id"));

  Video cat = makeVideo("Cat", 90);
  Video dog = makeVideo("Dog", 120);
  cpp_relate::insertObject(*db_, cat);
  auto dogRecord = cpp_relate::insertObject(*db_, dog);

  User user;
  user.name = "ada";
  user.favorite = cat.id;
  auto userRecord = cpp_relate::insertObject(*db_, user);

  auto favorite = db_->resolveOne(userRecord, "favorite");
  ASSERT_TRUE(favorite.has_value());
  EXPECT_EQ(cpp_relate::toObject<Video>(*favorite).title, "Cat");

  // Assigning through the association is visible to the typed view
  db_->assign(userRecord, "favorite", dogRecord);
  auto reloaded = cpp_relate::getObject<User>(*db_, user.id);
  EXPECT_EQ(reloaded.favorite.id, dog.id);
  EXPECT_EQ(reloaded.favorite.resolve(*db_)->get().title, "Dog");
}
