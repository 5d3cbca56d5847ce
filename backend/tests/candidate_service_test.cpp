#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "../common/candidates/candidate_service.h"
#include "../common/candidates/rejection.h"

using namespace candidates;

namespace {

// 2024-06-15T12:00:00Z
const Clock::time_point kNow = Clock::from_time_t(1718452800);

CandidateFields ValidFields() {
  CandidateFields fields;
  fields.full_name = "Jane Doe";
  fields.date_of_birth = "1994-02-28";
  fields.contact_number = "(02) 9876-5432";
  fields.address = "12 Example Street, Sydney";
  fields.qualification = "BSc Computer Science";
  fields.graduation_year = "2016";
  fields.years_of_experience = "7.5";
  fields.skills = "Python, python, SQL";
  return fields;
}

ResumeUpload Resume(const std::string &filename, const std::string &content = "%PDF-1.4 test") {
  return ResumeUpload{filename, content, "application/pdf"};
}

std::string ReadFile(const std::filesystem::path &path) {
  std::ifstream stream(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>());
}

class FailingStorage : public ResumeStorage {
 public:
  bool Exists(const std::string &) const override { return false; }
  void Write(const std::string &, const std::string &) override { throw std::runtime_error("disk_full"); }
  bool Remove(const std::string &) override { return false; }
};

class ServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
    root_ = std::filesystem::temp_directory_path() /
            (std::string("candidate_service_test_") + info->name());
    std::filesystem::remove_all(root_);
    upload_dir_ = root_ / "uploads";
    storage_ = std::make_unique<LocalResumeStorage>(upload_dir_);
    storage_->EnsureRoot();
    service_ = std::make_unique<CandidateService>(store_, *storage_, FilenameResolver(upload_dir_),
                                                  [this]() { return now_; });
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
  }

  std::filesystem::path root_;
  std::filesystem::path upload_dir_;
  Clock::time_point now_ = kNow;
  CandidateStore store_;
  std::unique_ptr<LocalResumeStorage> storage_;
  std::unique_ptr<CandidateService> service_;
};

}  // namespace

TEST_F(ServiceTest, CreateStoresRecordAndResume) {
  const auto record = service_->Create(ValidFields(), Resume("cv.pdf", "resume-bytes"));
  EXPECT_EQ(record.id, 1);
  EXPECT_EQ(record.profile.contact_number, "0298765432");
  EXPECT_EQ(record.profile.skills, (std::vector<std::string>{"Python", "SQL"}));
  EXPECT_EQ(record.resume_filename, "cv.pdf");
  EXPECT_EQ(record.resume_path, (upload_dir_ / "cv.pdf").string());
  EXPECT_EQ(record.resume_size, 12u);
  EXPECT_EQ(record.resume_checksum, Sha256Hex("resume-bytes"));
  EXPECT_EQ(record.created_at, kNow);
  EXPECT_EQ(ReadFile(record.resume_path), "resume-bytes");
}

TEST_F(ServiceTest, FetchedRecordMatchesCreatedRecord) {
  const auto created = service_->Create(ValidFields(), Resume("cv.pdf"));
  const auto fetched = service_->Get(created.id);
  ASSERT_TRUE(fetched.has_value());
  EXPECT_EQ(fetched->profile, created.profile);
  EXPECT_EQ(fetched->resume_path, created.resume_path);
  EXPECT_EQ(fetched->created_at, created.created_at);
}

TEST_F(ServiceTest, SecondUploadWithSameNameEmbedsItsId) {
  const auto first = service_->Create(ValidFields(), Resume("cv.pdf", "first"));
  const auto second = service_->Create(ValidFields(), Resume("cv.pdf", "second"));
  EXPECT_EQ(first.resume_path, (upload_dir_ / "cv.pdf").string());
  EXPECT_EQ(second.resume_path, (upload_dir_ / ("cv_(" + std::to_string(second.id) + ").pdf")).string());
  EXPECT_EQ(second.resume_filename, "cv_(2).pdf");
  EXPECT_EQ(ReadFile(first.resume_path), "first");
  EXPECT_EQ(ReadFile(second.resume_path), "second");
}

TEST_F(ServiceTest, UnsupportedTypeIsRejectedBeforeFieldValidation) {
  auto fields = ValidFields();
  fields.contact_number = "abc";
  try {
    service_->Create(fields, Resume("resume.txt"));
    FAIL() << "expected rejection";
  } catch (const CandidateRejected &rejected) {
    EXPECT_EQ(rejected.primary_kind(), ErrorKind::kUnsupportedFileType);
    ASSERT_EQ(rejected.rejections().size(), 1u);
    EXPECT_STREQ(rejected.what(), "Resume: Only PDF/DOC/DOCX allowed. Got: .txt");
  }
  EXPECT_EQ(store_.Size(), 0u);
}

TEST_F(ServiceTest, EmptyResumeFilenameIsUnsupported) {
  try {
    service_->Create(ValidFields(), Resume(""));
    FAIL() << "expected rejection";
  } catch (const CandidateRejected &rejected) {
    EXPECT_EQ(rejected.primary_kind(), ErrorKind::kUnsupportedFileType);
  }
  EXPECT_EQ(store_.Size(), 0u);
  EXPECT_TRUE(std::filesystem::is_empty(upload_dir_));
}

TEST_F(ServiceTest, ValidationFailureLeavesNothingBehind) {
  auto fields = ValidFields();
  fields.date_of_birth = "2999-01-01";
  EXPECT_THROW(service_->Create(fields, Resume("cv.pdf")), CandidateRejected);
  EXPECT_EQ(store_.Size(), 0u);
  EXPECT_TRUE(std::filesystem::is_empty(upload_dir_));
  // Validation happens before id allocation.
  EXPECT_EQ(store_.AllocateId(), 1);
}

TEST_F(ServiceTest, MissingResumeIsReportedWithFieldErrors) {
  auto fields = ValidFields();
  fields.skills = ",";
  try {
    service_->Create(fields, std::nullopt);
    FAIL() << "expected rejection";
  } catch (const CandidateRejected &rejected) {
    EXPECT_TRUE(ContainsKind(rejected.rejections(), ErrorKind::kEmptySkills));
    EXPECT_TRUE(ContainsKind(rejected.rejections(), ErrorKind::kMissingField));
  }
}

TEST_F(ServiceTest, FutureDateUsesServiceClock) {
  auto fields = ValidFields();
  fields.date_of_birth = "2024-06-16";
  EXPECT_THROW(service_->Create(fields, Resume("cv.pdf")), CandidateRejected);
  now_ = kNow + std::chrono::hours(24);
  EXPECT_NO_THROW(service_->Create(fields, Resume("cv.pdf")));
}

TEST_F(ServiceTest, DeleteRemovesRecordAndFile) {
  const auto record = service_->Create(ValidFields(), Resume("cv.pdf"));
  ASSERT_TRUE(std::filesystem::exists(record.resume_path));
  EXPECT_TRUE(service_->Delete(record.id));
  EXPECT_FALSE(service_->Get(record.id).has_value());
  EXPECT_FALSE(std::filesystem::exists(record.resume_path));
  EXPECT_TRUE(service_->List(CandidateFilter{}).empty());
  EXPECT_FALSE(service_->Delete(record.id));
}

TEST_F(ServiceTest, DeleteToleratesMissingFile) {
  const auto record = service_->Create(ValidFields(), Resume("cv.pdf"));
  std::filesystem::remove(record.resume_path);
  EXPECT_TRUE(service_->Delete(record.id));
  EXPECT_FALSE(service_->Get(record.id).has_value());
}

TEST_F(ServiceTest, ListFiltersAndSortsNewestFirst) {
  auto python = ValidFields();
  python.skills = "Python, Docker";
  python.years_of_experience = "3";
  python.graduation_year = "2019";
  auto java = ValidFields();
  java.skills = "Java";
  java.years_of_experience = "10";
  java.graduation_year = "2010";

  const auto first = service_->Create(python, Resume("a.pdf"));
  now_ += std::chrono::seconds(1);
  const auto second = service_->Create(java, Resume("b.pdf"));

  const auto all = service_->List(CandidateFilter{});
  ASSERT_EQ(all.size(), 2u);
  EXPECT_EQ(all[0].id, second.id);
  EXPECT_EQ(all[1].id, first.id);

  CandidateFilter by_skill;
  by_skill.skill = " python ";
  const auto skilled = service_->List(by_skill);
  ASSERT_EQ(skilled.size(), 1u);
  EXPECT_EQ(skilled[0].id, first.id);

  CandidateFilter by_experience;
  by_experience.min_experience = 10.0;
  const auto experienced = service_->List(by_experience);
  ASSERT_EQ(experienced.size(), 1u);
  EXPECT_EQ(experienced[0].id, second.id);

  CandidateFilter by_year;
  by_year.graduation_year = 2019;
  by_year.skill = "docker";
  const auto graduates = service_->List(by_year);
  ASSERT_EQ(graduates.size(), 1u);
  EXPECT_EQ(graduates[0].id, first.id);

  CandidateFilter nothing;
  nothing.skill = "Haskell";
  EXPECT_TRUE(service_->List(nothing).empty());
}

TEST_F(ServiceTest, SkillFilterMatchesNonAsciiCaseInsensitively) {
  auto fields = ValidFields();
  fields.skills = "\xC3\xA9lan, SQL";  // "élan, SQL"
  const auto record = service_->Create(fields, Resume("cv.pdf"));

  CandidateFilter upper;
  upper.skill = "\xC3\x89LAN";  // "ÉLAN"
  const auto matches = service_->List(upper);
  ASSERT_EQ(matches.size(), 1u);
  EXPECT_EQ(matches[0].id, record.id);
}

TEST_F(ServiceTest, NonAsciiDuplicateSkillsCollapse) {
  auto fields = ValidFields();
  fields.skills = "\xC3\x89lan, \xC3\xA9lan, SQL";
  const auto record = service_->Create(fields, Resume("cv.pdf"));
  EXPECT_EQ(record.profile.skills, (std::vector<std::string>{"\xC3\x89lan", "SQL"}));
}

TEST_F(ServiceTest, ConcurrentSameNameUploadsGetDistinctFiles) {
  constexpr int kThreads = 16;
  std::vector<CandidateRecord> created(kThreads);
  std::vector<std::string> failures(kThreads);
  std::vector<std::thread> workers;
  workers.reserve(kThreads);
  for (int i = 0; i < kThreads; ++i) {
    workers.emplace_back([this, i, &created, &failures]() {
      try {
        created[i] = service_->Create(ValidFields(), Resume("cv.pdf", "resume-" + std::to_string(i)));
      } catch (const std::exception &ex) {
        failures[i] = ex.what();
      }
    });
  }
  for (auto &worker : workers) {
    worker.join();
  }

  std::set<long long> ids;
  std::set<std::string> paths;
  for (int i = 0; i < kThreads; ++i) {
    EXPECT_EQ(failures[i], "");
    ids.insert(created[i].id);
    paths.insert(created[i].resume_path);
    EXPECT_EQ(ReadFile(created[i].resume_path), "resume-" + std::to_string(i));
  }
  EXPECT_EQ(ids.size(), static_cast<std::size_t>(kThreads));
  EXPECT_EQ(paths.size(), static_cast<std::size_t>(kThreads));
  EXPECT_EQ(store_.Size(), static_cast<std::size_t>(kThreads));
}

TEST(ServiceFailureTest, FailedWriteStoresNoRecord) {
  CandidateStore store;
  FailingStorage storage;
  CandidateService service(store, storage, FilenameResolver("uploads"), []() { return kNow; });
  EXPECT_THROW(service.Create(ValidFields(), Resume("cv.pdf")), std::runtime_error);
  EXPECT_EQ(store.Size(), 0u);
  EXPECT_TRUE(service.List(CandidateFilter{}).empty());
}

TEST(ChecksumTest, Sha256OfKnownInput) {
  EXPECT_EQ(Sha256Hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}
