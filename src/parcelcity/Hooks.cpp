#include "parcelcity/Hooks.hpp"

#include <algorithm>
#include <iostream>

namespace parcelcity {

const char* ToString(NoticeKind k)
{
  switch (k) {
  case NoticeKind::MoneyTake: return "money_take";
  case NoticeKind::MoneyGive: return "money_give";
  case NoticeKind::Error: return "error";
  case NoticeKind::Success: return "success";
  default: return "unknown";
  }
}

const char* ToString(SoundEffect s)
{
  switch (s) {
  case SoundEffect::Building: return "building";
  case SoundEffect::Bulldoze: return "bulldoze";
  case SoundEffect::Explosion: return "explosion";
  default: return "unknown";
  }
}

void LogNotifier::notify(const Notice& notice)
{
  std::ostream& os = (notice.kind == NoticeKind::Error) ? std::cerr : std::cout;
  os << "[notice:" << ToString(notice.kind) << "] " << notice.message << "\n";
}

void LogNotifier::playSound(SoundEffect effect)
{
  if (!m_logSounds) return;
  std::cout << "[sound] " << ToString(effect) << "\n";
}

void LogNotifier::setSessionFinished()
{
  if (!sessionFinished()) std::cout << "[session] finished\n";
  Notifier::setSessionFinished();
}

int RecordingNotifier::countKind(NoticeKind k) const
{
  return static_cast<int>(std::count_if(m_notices.begin(), m_notices.end(),
                                        [k](const Notice& n) { return n.kind == k; }));
}

void RecordingNotifier::clear()
{
  m_notices.clear();
  m_sounds.clear();
}

} // namespace parcelcity
