#include <cmath>
#include <string>
#include <vector>

#include "cpp_relate/test/testDatabase.hpp"
#include "cpp_relate/src/cpp_relate/DBDatabase.hpp"
#include "cpp_relate/src/cpp_relate/DBErrors.hpp"

using namespace std::string_literals;

using cpp_relate::AssociationDefinition;
using cpp_relate::AttributeType;
using cpp_relate::Range;
using cpp_relate::RecordSet;
using cpp_relate::ScopeArgs;

/*!
 * \brief Videos collected into playlists through likes
 *
 * Playlist.videos is a many-to-many association through Like. The Video
 * scopes `duration_min`, `sort` and `list` are registered the way an
 * application would register them.
 */
class PlaylistTest : public DatabaseTest
{
protected:
  void SetUp() override
  {
    DatabaseTest::SetUp();

    db_ = std::make_unique<cpp_relate::Database>(":memory:", pLogger_);
    defineVideo(*db_);
    db_->defineKind({"Playlist", {{"name", AttributeType::TEXT}}});
    db_->defineKind({"Like",
                     {{"playlist_id", AttributeType::INT},
                      {"video_id", AttributeType::INT}}});
    db_->defineAssociation("Playlist",
                           "videos",
                           AssociationDefinition::manyToManyThrough(
                             "Like", "Video", "playlist_id", "video_id"));

    db_->defineScope("Video",
                     "duration_min",
                     [](const RecordSet& records, const ScopeArgs& args)
                     {
                       return cpp_relate::where(
                         records, "duration", Range::atLeast(args.at(0)));
                     });
    db_->defineScope("Video",
                     "sort",
                     [](const RecordSet& records, const ScopeArgs& args)
                     {
                       return cpp_relate::order(
                         records, std::get<std::string>(args.at(0)));
                     });

    // Videos liked by the named playlist
    auto& db = *db_;
    db_->defineScope("Video",
                     "list",
                     [&db](const RecordSet& records, const ScopeArgs& args)
                     {
                       RecordSet liked = db.query("Playlist")
                                           .where("name", args.at(0))
                                           .join("videos")
                                           .toSequence();
                       return cpp_relate::merge(records, liked);
                     });

    auto cat = insertVideo(db, "Cat", "youtube", 90);
    auto dog = insertVideo(db, "Dog", "youtube", 120);
    auto banana = insertVideo(db, "Banana", "vimeo", 140);
    auto apple = insertVideo(db, "Apple", "dailymotion", 240);
    auto orange = insertVideo(db, "Orange", "dailymotion", 30);

    auto animals = db.insert("Playlist", {{"name", "Animals"s}});
    auto fruits = db.insert("Playlist", {{"name", "Fruits"s}});

    db.append(animals, "videos", {cat, dog});
    db.append(fruits, "videos", {banana, apple, orange});
  }

  std::vector<std::string> titlesOf(const RecordSet& records) const
  {
    std::vector<std::string> titles;
    for (const auto& record : records)
    {
      titles.push_back(record.getAs<std::string>("title"));
    }
    return titles;
  }

  std::unique_ptr<cpp_relate::Database> db_;
};

TEST_F(PlaylistTest, LongVideosSortedByEngine)
{
  auto videos = db_->query("Video")
                  .scope("duration_min", {int64_t{100}})
                  .scope("sort", {"engine"s})
                  .toSequence();

  EXPECT_EQ(titlesOf(videos),
            (std::vector<std::string>{"Apple", "Banana", "Dog"}));
}

TEST_F(PlaylistTest, PlaylistContents)
{
  auto animals = db_->query("Playlist").where("name", "Animals"s).first();
  auto fruits = db_->query("Playlist").where("name", "Fruits"s).first();

  EXPECT_EQ(titlesOf(db_->resolve(animals, "videos")),
            (std::vector<std::string>{"Cat", "Dog"}));
  EXPECT_EQ(titlesOf(db_->resolve(fruits, "videos")),
            (std::vector<std::string>{"Banana", "Apple", "Orange"}));
  EXPECT_EQ(db_->count("Like"), 5);
}

TEST_F(PlaylistTest, AverageDurationPerPlaylist)
{
  double animals = db_->query("Video").scope("list", {"Animals"s}).average("duration");
  double fruits = db_->query("Video").scope("list", {"Fruits"s}).average("duration");

  EXPECT_DOUBLE_EQ(animals, 105.0);
  EXPECT_NEAR(fruits, 136.67, 0.01);
  EXPECT_EQ(static_cast<int64_t>(std::trunc(fruits)), 136);

  // Same numbers through a join
  EXPECT_DOUBLE_EQ(db_->query("Playlist")
                     .where("name", "Animals"s)
                     .join("videos")
                     .average("duration"),
                   105.0);

  EXPECT_DOUBLE_EQ(
    db_->query("Video").scope("list", {"Unknown"s}).average("duration"), 0.0);
}

TEST_F(PlaylistTest, ScopesCombineWithPlaylists)
{
  auto longFruits = db_->query("Video")
                      .scope("list", {"Fruits"s})
                      .scope("duration_min", {int64_t{100}})
                      .scope("sort", {"title"s})
                      .toSequence();

  EXPECT_EQ(titlesOf(longFruits),
            (std::vector<std::string>{"Apple", "Banana"}));

  auto firstAnimal = db_->query("Video").scope("list", {"Animals"s}).first();
  EXPECT_EQ(firstAnimal.getAs<std::string>("title"), "Cat");

  EXPECT_THROW(db_->query("Video").scope("list", {"Unknown"s}).first(),
               cpp_relate::EmptySetError);
}
