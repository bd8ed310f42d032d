#include <gtest/gtest.h>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include "simple_uikit.hpp"

struct track {
    std::string title;
    int position;
};

struct track_row : public su::refreshable {
    track_row(std::shared_ptr<track> t) : m_track(std::move(t)) { }

    void refresh() {
        m_label = std::to_string(m_track->position) + ". " + m_track->title;
    }

    std::shared_ptr<track> m_track;
    std::string m_label;
};

// a playlist widget is a list of rows kept in a 1:1 mapping with its tracks
struct playlist : public su::widget_list<track_row> {
    playlist() :
        m_tracks(*this,
                 [](const std::shared_ptr<track>& t) {
                     auto row = std::make_shared<track_row>(t);
                     row->refresh();
                     return row;
                 },
                 [](const track& t) { return t.position; })
    { }

    void print() {
        for(auto& row : widgets()) {
            std::cout << row->m_label << std::endl;
        }
    }

    su::object_container<track, track_row, int> m_tracks;
};

TEST(example, ordered_object_lists) {
    playlist list;
    auto intro = std::make_shared<track>(track{ "intro", 1 });
    auto finale = std::make_shared<track>(track{ "finale", 3 });
    auto middle = std::make_shared<track>(track{ "middle", 2 });

    list.m_tracks.add_item(intro);
    list.m_tracks.add_item(finale);
    list.m_tracks.add_item(middle);
    list.print();

    EXPECT_EQ(std::string("1. intro"), list.widget_at(0)->m_label);
    EXPECT_EQ(std::string("2. middle"), list.widget_at(1)->m_label);
    EXPECT_EQ(std::string("3. finale"), list.widget_at(2)->m_label);

    // move the finale to the front, the reorder refreshes every row
    finale->position = 0;
    list.m_tracks.update_order();
    list.print();

    EXPECT_EQ(std::string("0. finale"), list.widget_at(0)->m_label);
    EXPECT_EQ(finale, list.m_tracks.item_for_widget(list.widget_at(0)));
}
