#include <string>
#include <vector>

#include "cpp_relate/test/testDatabase.hpp"
#include "cpp_relate/src/cpp_relate/DBAssociation.hpp"
#include "cpp_relate/src/cpp_relate/DBDatabase.hpp"
#include "cpp_relate/src/cpp_relate/DBErrors.hpp"

using namespace std::string_literals;

using cpp_relate::AssociationDefinition;
using cpp_relate::AttributeType;

namespace
{

std::vector<std::string> titlesOf(const cpp_relate::RecordSet& records)
{
  std::vector<std::string> titles;
  for (const auto& record : records)
  {
    titles.push_back(record.getAs<std::string>("title"));
  }
  return titles;
}

}  // namespace

class AssociationTest : public DatabaseTest
{
protected:
  void SetUp() override
  {
    DatabaseTest::SetUp();

    db_ = std::make_unique<cpp_relate::Database>(":memory:", pLogger_);
    db_->defineKind({"Video",
                     {{"title", AttributeType::TEXT},
                      {"engine", AttributeType::TEXT},
                      {"duration", AttributeType::INT},
                      {"sequel_id", AttributeType::INT, false}}});
    db_->defineKind({"Playlist", {{"name", AttributeType::TEXT}}});
    db_->defineKind({"Like",
                     {{"playlist_id", AttributeType::INT},
                      {"video_id", AttributeType::INT}}});
    db_->defineKind({"Comment",
                     {{"body", AttributeType::TEXT},
                      {"video_id", AttributeType::INT, false}}});
  }

  cpp_relate::Record video(const std::string& title, int64_t duration)
  {
    return db_->insert(
      "Video",
      {{"title", title}, {"engine", "youtube"s}, {"duration", duration}});
  }

  std::unique_ptr<cpp_relate::Database> db_;
};

TEST_F(AssociationTest, OneToOneAssignAndResolve)
{
  db_->defineAssociation(
    "Video", "sequel", AssociationDefinition::oneToOne("Video", "sequel_id"));

  auto first = video("Alien", 117);
  auto second = video("Aliens", 137);

  EXPECT_TRUE(db_->resolve(first, "sequel").empty());
  EXPECT_FALSE(db_->resolveOne(first, "sequel").has_value());

  db_->assign(first, "sequel", second);
  EXPECT_EQ(first.getAs<int64_t>("sequel_id"), second.getId());

  // The assignment is persisted, not only applied to the snapshot
  auto reloaded = db_->get("Video", first.getId());
  auto sequel = db_->resolveOne(reloaded, "sequel");
  ASSERT_TRUE(sequel.has_value());
  EXPECT_EQ(*sequel, second);

  auto asSet = db_->resolve(reloaded, "sequel");
  ASSERT_EQ(asSet.size(), 1);
  EXPECT_EQ(asSet.front().getAs<std::string>("title"), "Aliens");

  // Clearing the association
  db_->assign(first, "sequel", std::nullopt);
  EXPECT_TRUE(first.isNull("sequel_id"));
  EXPECT_FALSE(
    db_->resolveOne(db_->get("Video", first.getId()), "sequel").has_value());
}

TEST_F(AssociationTest, OneToOneDanglingReference)
{
  db_->defineAssociation(
    "Video", "sequel", AssociationDefinition::oneToOne("Video", "sequel_id"));

  auto first = video("Alien", 117);
  db_->update(first, "sequel_id", 77);

  EXPECT_TRUE(db_->resolve(first, "sequel").empty());
  EXPECT_THROW(db_->resolveOne(first, "sequel"), cpp_relate::NotFoundError);
}

TEST_F(AssociationTest, OneToOneRejectsWrongTarget)
{
  db_->defineAssociation(
    "Video", "sequel", AssociationDefinition::oneToOne("Video", "sequel_id"));

  auto first = video("Alien", 117);
  auto animals = db_->insert("Playlist", {{"name", "Animals"s}});

  EXPECT_THROW(db_->assign(first, "sequel", animals),
               cpp_relate::ValidationError);
  EXPECT_THROW(db_->append(first, "sequel", {video("Aliens", 137)}),
               cpp_relate::ValidationError);
  EXPECT_TRUE(db_->get("Video", first.getId()).isNull("sequel_id"));
}

TEST_F(AssociationTest, OneToMany)
{
  db_->defineAssociation(
    "Video", "comments", AssociationDefinition::oneToMany("Comment", "video_id"));

  auto cat = video("Cat", 90);
  auto dog = video("Dog", 120);

  auto first = db_->insert("Comment", {{"body", "cute"s}});
  auto second = db_->insert("Comment", {{"body", "so cute"s}});
  db_->insert("Comment",
              {{"body", "woof"s}, {"video_id", static_cast<int64_t>(dog.getId())}});

  EXPECT_TRUE(db_->resolve(cat, "comments").empty());

  db_->append(cat, "comments", {first, second});

  auto comments = db_->resolve(cat, "comments");
  ASSERT_EQ(comments.size(), 2);
  EXPECT_EQ(comments[0].getAs<std::string>("body"), "cute");
  EXPECT_EQ(comments[1].getAs<std::string>("body"), "so cute");
  EXPECT_EQ(db_->resolve(dog, "comments").size(), 1);

  EXPECT_THROW(db_->resolveOne(cat, "comments"), cpp_relate::ValidationError);
  EXPECT_THROW(db_->assign(cat, "comments", first), cpp_relate::ValidationError);
}

TEST_F(AssociationTest, ThroughAppendKeepsDuplicates)
{
  db_->defineAssociation("Playlist",
                         "videos",
                         AssociationDefinition::manyToManyThrough(
                           "Like", "Video", "playlist_id", "video_id"));

  auto animals = db_->insert("Playlist", {{"name", "Animals"s}});
  auto cat = video("Cat", 90);
  auto dog = video("Dog", 120);

  EXPECT_TRUE(db_->resolve(animals, "videos").empty());

  db_->append(animals, "videos", {cat, dog});
  EXPECT_EQ(titlesOf(db_->resolve(animals, "videos")),
            (std::vector<std::string>{"Cat", "Dog"}));

  // Appending again grows the collection by exactly what was appended
  db_->append(animals, "videos", {cat});
  EXPECT_EQ(titlesOf(db_->resolve(animals, "videos")),
            (std::vector<std::string>{"Cat", "Dog", "Cat"}));
  EXPECT_EQ(db_->count("Like"), 3);

  // Appending nothing is a no-op
  db_->append(animals, "videos", {});
  EXPECT_EQ(db_->count("Like"), 3);
}

TEST_F(AssociationTest, ThroughAppendChecksItemsFirst)
{
  db_->defineAssociation("Playlist",
                         "videos",
                         AssociationDefinition::manyToManyThrough(
                           "Like", "Video", "playlist_id", "video_id"));

  auto animals = db_->insert("Playlist", {{"name", "Animals"s}});
  auto fruits = db_->insert("Playlist", {{"name", "Fruits"s}});
  auto cat = video("Cat", 90);

  EXPECT_THROW(db_->append(animals, "videos", {cat, fruits}),
               cpp_relate::ValidationError);
  EXPECT_EQ(db_->count("Like"), 0);
}

TEST_F(AssociationTest, ThroughSkipsMissingTargets)
{
  db_->defineAssociation("Playlist",
                         "videos",
                         AssociationDefinition::manyToManyThrough(
                           "Like", "Video", "playlist_id", "video_id"));

  auto animals = db_->insert("Playlist", {{"name", "Animals"s}});
  auto cat = video("Cat", 90);
  db_->insert("Like", {{"playlist_id", 1}, {"video_id", 99}});
  db_->append(animals, "videos", {cat});

  EXPECT_EQ(titlesOf(db_->resolve(animals, "videos")),
            (std::vector<std::string>{"Cat"}));
}

TEST_F(AssociationTest, DefinitionErrors)
{
  auto definition = AssociationDefinition::oneToMany("Comment", "video_id");
  db_->defineAssociation("Video", "comments", definition);

  EXPECT_TRUE(db_->getAssociations().contains("Video", "comments"));
  EXPECT_FALSE(db_->getAssociations().contains("Playlist", "comments"));

  EXPECT_THROW(db_->defineAssociation("Video", "comments", definition),
               cpp_relate::DuplicateAssociationError);
  EXPECT_THROW(db_->defineAssociation("Channel", "comments", definition),
               cpp_relate::UnknownKindError);
  EXPECT_THROW(db_->defineAssociation("Video", "bad name", definition),
               cpp_relate::ValidationError);

  // Missing and mistyped foreign keys on a defined owning kind
  EXPECT_THROW(
    db_->defineAssociation(
      "Video", "sequel", AssociationDefinition::oneToOne("Video", "prequel_id")),
    cpp_relate::ValidationError);
  EXPECT_THROW(
    db_->defineAssociation(
      "Video", "named", AssociationDefinition::oneToOne("Video", "title")),
    cpp_relate::ValidationError);
  EXPECT_THROW(db_->defineAssociation(
                 "Playlist",
                 "videos",
                 AssociationDefinition::manyToManyThrough(
                   "Like", "Video", "playlist_id", "clip_id")),
               cpp_relate::ValidationError);
}

TEST_F(AssociationTest, UnknownAssociation)
{
  auto cat = video("Cat", 90);

  EXPECT_THROW(db_->resolve(cat, "comments"),
               cpp_relate::UnknownAssociationError);
  EXPECT_THROW(db_->append(cat, "comments", {}),
               cpp_relate::UnknownAssociationError);
  EXPECT_THROW(db_->getAssociations().find("Video", "comments"),
               cpp_relate::UnknownAssociationError);
}

TEST_F(AssociationTest, ForeignKeyCheckedOnceOwnerIsDefined)
{
  // The join kind does not exist yet, so the keys are checked later
  db_->defineAssociation("Playlist",
                         "tags",
                         AssociationDefinition::manyToManyThrough(
                           "Tagging", "Tag", "playlist_id", "tag_id"));
  db_->defineKind({"Tag", {{"label", AttributeType::TEXT}}});
  db_->defineKind({"Tagging",
                   {{"playlist_id", AttributeType::INT},
                    {"tag_id", AttributeType::INT}}});

  auto animals = db_->insert("Playlist", {{"name", "Animals"s}});
  auto pets = db_->insert("Tag", {{"label", "pets"s}});
  db_->append(animals, "tags", {pets});

  auto tags = db_->resolve(animals, "tags");
  ASSERT_EQ(tags.size(), 1);
  EXPECT_EQ(tags.front().getAs<std::string>("label"), "pets");
}

TEST_F(AssociationTest, OneToManyAppendWritesNothingWhenAnItemIsMissing)
{
  db_->defineAssociation(
    "Video", "comments", AssociationDefinition::oneToMany("Comment", "video_id"));

  auto cat = video("Cat", 90);
  auto stored = db_->insert("Comment", {{"body", "cute"s}});
  cpp_relate::Record missing{"Comment", 42, stored.getAttributes()};

  EXPECT_THROW(db_->append(cat, "comments", {stored, missing}),
               cpp_relate::NotFoundError);
  EXPECT_TRUE(db_->resolve(cat, "comments").empty());
  EXPECT_TRUE(db_->get("Comment", stored.getId()).isNull("video_id"));
}

TEST_F(AssociationTest, ThroughAppendRejectsRecordsNotInStore)
{
  db_->defineAssociation("Playlist",
                         "videos",
                         AssociationDefinition::manyToManyThrough(
                           "Like", "Video", "playlist_id", "video_id"));

  auto animals = db_->insert("Playlist", {{"name", "Animals"s}});
  auto cat = video("Cat", 90);
  cpp_relate::Record missingVideo{"Video", 77, cat.getAttributes()};
  cpp_relate::Record missingPlaylist{"Playlist", 9, animals.getAttributes()};

  EXPECT_THROW(db_->append(animals, "videos", {cat, missingVideo}),
               cpp_relate::NotFoundError);
  EXPECT_THROW(db_->append(missingPlaylist, "videos", {cat}),
               cpp_relate::NotFoundError);
  EXPECT_EQ(db_->count("Like"), 0);

  // Every appended item shows up once the append succeeds
  db_->append(animals, "videos", {cat, cat});
  EXPECT_EQ(db_->resolve(animals, "videos").size(), 2);
}

TEST_F(AssociationTest, AssignRequiresStoredTarget)
{
  db_->defineAssociation(
    "Video", "sequel", AssociationDefinition::oneToOne("Video", "sequel_id"));

  auto first = video("Alien", 117);
  cpp_relate::Record missing{"Video", 55, first.getAttributes()};

  EXPECT_THROW(db_->assign(first, "sequel", missing), cpp_relate::NotFoundError);
  EXPECT_TRUE(first.isNull("sequel_id"));
  EXPECT_TRUE(db_->get("Video", first.getId()).isNull("sequel_id"));
}

TEST_F(AssociationTest, ForeignKeyBeyondIdRangeIsDangling)
{
  db_->defineAssociation(
    "Video", "sequel", AssociationDefinition::oneToOne("Video", "sequel_id"));

  // 2^32 + 1 would wrap around to the id of the record itself
  auto first = video("Alien", 117);
  db_->update(first, "sequel_id", int64_t{4294967297});

  EXPECT_TRUE(db_->resolve(first, "sequel").empty());
  EXPECT_THROW(db_->resolveOne(first, "sequel"), cpp_relate::NotFoundError);
}
