/*
 * 설명: 원장을 앞에서부터 접어 점수, 위켓, 오버, 엑스트라, 파트너십, 스코어카드를 누적한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: scorer/tests/unit/replay_test.cpp, scorer/tests/unit/innings_transition_test.cpp
 */
#include "scorer/replay.hpp"

#include <algorithm>
#include <utility>
#include <variant>

#include "scorer/extras.hpp"
#include "scorer/over_state.hpp"
#include "scorer/transition.hpp"
#include "scorer/wicket.hpp"

namespace scorer {
namespace {

class ReplayFolder {
 public:
  ReplayFolder(const MatchConfig& config, const ScoringRules& rules) : rules_(rules) {
    snapshot_.config = config;
    snapshot_.started_at = config.started_at;
    const std::size_t batting = BattingFirstIndex(config);
    snapshot_.batting_team = config.teams[batting].id;
    snapshot_.bowling_team = config.teams[1 - batting].id;
    OpenInnings(1, config.opening_striker, config.opening_non_striker, config.opening_bowler);
  }

  void Apply(const LedgerEntry& entry) {
    ++snapshot_.ledger_size;
    if (const auto* ball = std::get_if<Ball>(&entry)) {
      ApplyBall(*ball);
      return;
    }
    const auto& opening = std::get<InningsOpening>(entry);
    snapshot_.phase = MatchPhase::kInnings2InProgress;
    OpenInnings(opening.innings, opening.striker, opening.non_striker, opening.bowler);
  }

  MatchSnapshot Finish() {
    snapshot_.crease = over_.State();
    return std::move(snapshot_);
  }

 private:
  void OpenInnings(int number, const PlayerId& striker, const PlayerId& non_striker, const PlayerId& bowler) {
    InningsSummary innings;
    innings.number = number;
    innings.batting_team = snapshot_.batting_team;
    innings.bowling_team = snapshot_.bowling_team;
    snapshot_.innings.push_back(std::move(innings));
    snapshot_.current_innings = number;
    BatterIndex(snapshot_.innings.back(), striker);
    BatterIndex(snapshot_.innings.back(), non_striker);
    over_.Open(striker, non_striker, bowler);
    partnership_open_ = false;
    over_runs_ = 0;
  }

  void ApplyBall(const Ball& ball) {
    InningsSummary& innings = snapshot_.innings.back();
    const DeliveryCredit credit = ClassifyDelivery(ball, rules_);

    if (!partnership_open_) {
      innings.partnerships.push_back(Partnership{ball.striker, ball.non_striker, 0, 0});
      partnership_open_ = true;
    }
    const std::size_t striker_index = BatterIndex(innings, ball.striker);
    BatterIndex(innings, ball.non_striker);
    const std::size_t bowler_index = BowlerIndex(innings, ball.bowler);

    innings.score += credit.TotalRuns();
    innings.extras += credit.extras;
    if (credit.legal) {
      ++innings.legal_balls;
    }

    BattingCard& striker = innings.batting[striker_index];
    striker.runs += credit.batsman_runs;
    if (!ball.wide) {
      ++striker.balls;
      if (credit.batsman_runs == 0) {
        ++striker.dot_balls;
      }
    }
    if (credit.four) {
      ++striker.fours;
    }
    if (credit.six) {
      ++striker.sixes;
    }

    BowlingCard& bowler = innings.bowling[bowler_index];
    bowler.runs_conceded += credit.bowler_conceded;
    if (credit.legal) {
      ++bowler.legal_balls;
      if (credit.TotalRuns() == 0) {
        ++bowler.dot_balls;
      }
    }
    if (ball.wide) {
      ++bowler.wides;
    }
    if (ball.no_ball) {
      ++bowler.no_balls;
    }

    Partnership& partnership = innings.partnerships.back();
    partnership.runs += credit.TotalRuns();
    if (credit.legal) {
      ++partnership.balls;
    }
    over_runs_ += credit.TotalRuns();

    std::optional<DismissalCredit> dismissal;
    if (ball.wicket) {
      dismissal = ResolveDismissal(ball);
      ApplyDismissal(innings, ball, *dismissal, bowler_index);
    }

    const InningsEnd end = DetectInningsEnd(innings, BattingRosterSize(innings), snapshot_.config.total_overs,
                                            innings.number == 2 ? snapshot_.target : std::nullopt);
    const bool final_ball = end != InningsEnd::kNone;

    if (over_.Advance(ball, credit.legal, final_ball) == OverEvent::kOverComplete) {
      if (over_runs_ == 0) {
        ++innings.bowling[bowler_index].maidens;
      }
      over_runs_ = 0;
    }
    if (dismissal) {
      over_.Dismiss(dismissal->batter_out);
    }
    if (final_ball) {
      CloseInnings(innings, end, ball);
    }
  }

  void ApplyDismissal(InningsSummary& innings, const Ball& ball, const DismissalCredit& dismissal,
                      std::size_t bowler_index) {
    ++innings.wickets;
    BattingCard& out = innings.batting[BatterIndex(innings, dismissal.batter_out)];
    out.out = dismissal.counts_as_out;
    out.retired = !dismissal.counts_as_out;
    out.dismissal = dismissal.kind;
    if (dismissal.bowler_credited) {
      out.dismissed_by = ball.bowler;
      ++innings.bowling[bowler_index].wickets;
    }
    if (dismissal.fielding) {
      out.fielder = dismissal.fielding->fielder;
      innings.fielding.push_back(*dismissal.fielding);
    }
    innings.fall_of_wickets.push_back(
        FallOfWicket{innings.wickets, dismissal.batter_out, innings.score, innings.legal_balls});
    partnership_open_ = false;
  }

  void CloseInnings(InningsSummary& innings, InningsEnd end, const Ball& ball) {
    innings.complete = true;
    innings.end = end;
    if (innings.number == 1) {
      snapshot_.phase = MatchPhase::kInnings1Complete;
      snapshot_.first_innings_score = innings.score;
      snapshot_.target = innings.score + 1;
      std::swap(snapshot_.batting_team, snapshot_.bowling_team);
      over_.Reset();
      return;
    }
    snapshot_.phase = MatchPhase::kMatchComplete;
    snapshot_.completed = true;
    snapshot_.ended_at = ball.recorded_at;
    snapshot_.result = ResolveResult(snapshot_);
  }

  std::size_t BattingRosterSize(const InningsSummary& innings) const {
    auto index = FindTeamIndex(snapshot_.config, innings.batting_team);
    return index ? snapshot_.config.teams[*index].players.size() : 0;
  }

  static std::size_t BatterIndex(InningsSummary& innings, const PlayerId& player) {
    auto it = std::find_if(innings.batting.begin(), innings.batting.end(),
                           [&](const BattingCard& card) { return card.player == player; });
    if (it != innings.batting.end()) {
      return static_cast<std::size_t>(it - innings.batting.begin());
    }
    BattingCard card;
    card.player = player;
    innings.batting.push_back(std::move(card));
    return innings.batting.size() - 1;
  }

  static std::size_t BowlerIndex(InningsSummary& innings, const PlayerId& player) {
    auto it = std::find_if(innings.bowling.begin(), innings.bowling.end(),
                           [&](const BowlingCard& card) { return card.player == player; });
    if (it != innings.bowling.end()) {
      return static_cast<std::size_t>(it - innings.bowling.begin());
    }
    BowlingCard card;
    card.player = player;
    innings.bowling.push_back(std::move(card));
    return innings.bowling.size() - 1;
  }

  ScoringRules rules_;
  MatchSnapshot snapshot_;
  OverStateMachine over_;
  bool partnership_open_{false};
  int over_runs_{0};
};

}  // namespace

MatchSnapshot Replay(const MatchConfig& config, const std::vector<LedgerEntry>& entries, const ScoringRules& rules) {
  return Replay(config, entries, entries.size(), rules);
}

MatchSnapshot Replay(const MatchConfig& config, const std::vector<LedgerEntry>& entries, std::size_t prefix_length,
                     const ScoringRules& rules) {
  ReplayFolder folder(config, rules);
  const std::size_t limit = std::min(prefix_length, entries.size());
  for (std::size_t i = 0; i < limit; ++i) {
    folder.Apply(entries[i]);
  }
  return folder.Finish();
}

}  // namespace scorer
