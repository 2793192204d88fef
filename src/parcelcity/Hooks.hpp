#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace parcelcity {

class Building;
class City;
class Parcel;

// Narrow interfaces the simulation core calls into. Presentation, audio and
// road routing live behind these so the core stays headless.

enum class NoticeKind : std::uint8_t {
  MoneyTake = 0,
  MoneyGive,
  Error,
  Success,
};

enum class SoundEffect : std::uint8_t {
  Building = 0,
  Bulldoze,
  Explosion,
};

const char* ToString(NoticeKind k);
const char* ToString(SoundEffect s);

struct Notice {
  NoticeKind kind = NoticeKind::Success;
  std::string message;
};

// Fire-and-forget user feedback plus the session-finished flag consulted by
// the presentation layer.
class Notifier {
public:
  virtual ~Notifier() = default;

  virtual void notify(const Notice& notice) = 0;
  virtual void playSound(SoundEffect effect) = 0;

  virtual void setSessionFinished() { m_finished = true; }
  bool sessionFinished() const { return m_finished; }

private:
  bool m_finished = false;
};

class NullNotifier final : public Notifier {
public:
  void notify(const Notice&) override {}
  void playSound(SoundEffect) override {}
};

// Writes notices to std::cout (errors to std::cerr).
class LogNotifier final : public Notifier {
public:
  explicit LogNotifier(bool logSounds = true) : m_logSounds(logSounds) {}

  void notify(const Notice& notice) override;
  void playSound(SoundEffect effect) override;
  void setSessionFinished() override;

private:
  bool m_logSounds = true;
};

// Keeps everything in memory (tests, script runner).
class RecordingNotifier final : public Notifier {
public:
  void notify(const Notice& notice) override { m_notices.push_back(notice); }
  void playSound(SoundEffect effect) override { m_sounds.push_back(effect); }

  const std::vector<Notice>& notices() const { return m_notices; }
  const std::vector<SoundEffect>& sounds() const { return m_sounds; }

  int countKind(NoticeKind k) const;
  void clear();

private:
  std::vector<Notice> m_notices;
  std::vector<SoundEffect> m_sounds;
};

// Road-network sync: called whenever a road is placed, bulldozed or
// destroyed, and whenever a residential building is destroyed.
// `building` is null when the tile becomes empty.
class RoadNetworkSync {
public:
  virtual ~RoadNetworkSync() = default;
  virtual void updateTile(int x, int y, const Building* building) = 0;
};

// View refresh for a parcel after any occupancy change on it or a neighbor.
class ViewAdapter {
public:
  virtual ~ViewAdapter() = default;
  virtual void refreshView(const Parcel& parcel, const City& city) = 0;
};

class NullViewAdapter final : public ViewAdapter {
public:
  void refreshView(const Parcel&, const City&) override {}
};

// A registered simulation service, advanced once per tick in registration order.
class SimService {
public:
  virtual ~SimService() = default;
  virtual void simulate(City& city) = 0;
  virtual const char* name() const { return "service"; }
};

} // namespace parcelcity
