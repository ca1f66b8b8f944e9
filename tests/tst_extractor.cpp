// Copyright (C) 2004-2025 Robert Griebl
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include <QStringList>

#include "brickharvest/inventoryextractor.h"
#include "html/markdown.h"
#include "utility/exception.h"
#include "fakenetwork.h"

using namespace BrickHarvest;
using Mode = InventoryExtractor::Mode;


static const QUrl baseUrl(u"https://www.bricklink.com/catalogItemInv.asp?S=1-1&viewType=R"_qs);

static const QString header = u"| **Image** | **Qty** | **Item No** | **Description** |\n"
                              u"| --- | --- | --- | --- |\n"_qs;

static QString setLine(const QString &setNumber, const QString &name)
{
    return u"| [![Set No: %1  Name: %2](https://img.bricklink.com/S/%1.jpg)]"
           u"(https://www.bricklink.com/catalogItemPic.asp?S=%1) | **%1** |\n"_qs.arg(setNumber, name);
}

static QString sectionRow(const QString &title)
{
    return u"| **%1** |  |  |  |\n"_qs.arg(title);
}

static QString partRow(const QString &id, int colorId, const QString &color, const QString &name, int qty)
{
    return u"| ![Part No: %1  Name: %4](https://img.bricklink.com/ItemImage/PN/%2/%1.png) | %5 "
           u"| [%1](https://www.bricklink.com/v2/catalog/catalogitem.page?P=%1&idColor=%2) "
           u"| **%3 %4** |\n"_qs.arg(id, QString::number(colorId), color, name, QString::number(qty));
}

static Inventory partsOnly(const QString &markdown)
{
    return InventoryExtractor::extract(markdown, u"1-1"_qs, baseUrl, Mode::PartsOnly);
}


TEST(InventoryExtractorTest, ThrowsWithoutItemTable)
{
    EXPECT_THROW(partsOnly(u"# Nothing to see\n\nJust text."_qs), TableNotFoundException);
    EXPECT_THROW(InventoryExtractor::extract({ }, u"1-1"_qs, baseUrl), TableNotFoundException);
}

TEST(InventoryExtractorTest, ParsesPartRows)
{
    const Inventory inv = partsOnly(header + partRow(u"87994"_qs, 11, u"Black"_qs, u"Bar 3L (Bar Arrow)"_qs, 2));

    ASSERT_EQ(inv.parts.size(), 1u);
    const Part &part = inv.parts.front();
    EXPECT_EQ(part.id, u"87994"_qs);
    EXPECT_EQ(part.name, u"Bar 3L (Bar Arrow)"_qs);
    EXPECT_EQ(part.colorName, u"Black"_qs);
    EXPECT_EQ(part.colorId, u"11"_qs);
    EXPECT_EQ(part.quantity, 2);
    EXPECT_EQ(part.section, PartSection::Regular);
    EXPECT_EQ(part.url, QUrl(u"https://www.bricklink.com/v2/catalog/catalogitem.page?P=87994&idColor=11"_qs));
    EXPECT_EQ(part.imageUrl, QUrl(u"https://img.bricklink.com/ItemImage/PN/11/87994.png"_qs));
    EXPECT_TRUE(part.inventoryUrl.isEmpty());
    EXPECT_TRUE(part.subparts.empty());
    EXPECT_TRUE(inv.minifigures.isEmpty());
    EXPECT_EQ(inv.setNumber, u"1-1"_qs);
}

TEST(InventoryExtractorTest, SectionsAreSticky)
{
    const QString markdown = header
            + sectionRow(u"Regular Items:"_qs)
            + partRow(u"3001"_qs, 1, u"White"_qs, u"Brick 2 x 4"_qs, 4)
            + sectionRow(u"Counterpart Items:"_qs)
            + partRow(u"3002"_qs, 5, u"Red"_qs, u"Brick 2 x 3"_qs, 2)
            + partRow(u"3003"_qs, 5, u"Red"_qs, u"Brick 2 x 2"_qs, 1)
            + sectionRow(u"Alternate Items:"_qs)
            + partRow(u"3004"_qs, 11, u"Black"_qs, u"Brick 1 x 2"_qs, 3)
            + sectionRow(u"Extra Items:"_qs)
            + partRow(u"3005"_qs, 1, u"White"_qs, u"Brick 1 x 1"_qs, 1);

    const Inventory inv = partsOnly(markdown);

    ASSERT_EQ(inv.parts.size(), 5u);
    EXPECT_EQ(inv.parts[0].section, PartSection::Regular);
    EXPECT_EQ(inv.parts[1].section, PartSection::Counterpart);
    EXPECT_EQ(inv.parts[2].section, PartSection::Counterpart);
    EXPECT_EQ(inv.parts[3].section, PartSection::Alternate);
    EXPECT_EQ(inv.parts[4].section, PartSection::Extra);
    EXPECT_EQ(inv.parts[2].id, u"3003"_qs);
    EXPECT_EQ(inv.parts[2].colorName, u"Red"_qs);
}

TEST(InventoryExtractorTest, SectionMarkersIgnorePunctuation)
{
    const QString markdown = header
            + u"| *Counterparts* |  |  |  |\n"_qs
            + partRow(u"3001"_qs, 1, u"White"_qs, u"Brick 2 x 4"_qs, 4)
            + u"| Extra: |  |  |  |\n"_qs
            + partRow(u"3002"_qs, 1, u"White"_qs, u"Brick 2 x 3"_qs, 1)
            + u"| **Regular Items** |  |  |  |\n"_qs
            + partRow(u"3003"_qs, 1, u"White"_qs, u"Brick 2 x 2"_qs, 1);

    const Inventory inv = partsOnly(markdown);

    ASSERT_EQ(inv.parts.size(), 3u);
    EXPECT_EQ(inv.parts[0].section, PartSection::Counterpart);
    EXPECT_EQ(inv.parts[1].section, PartSection::Extra);
    EXPECT_EQ(inv.parts[2].section, PartSection::Regular);
}

TEST(InventoryExtractorTest, IgnoresSectionWordsInItemRows)
{
    // a minifigure listed before the minifigure marker, whose name starts like a section title
    const QString markdown = header
            + partRow(u"3001"_qs, 1, u"White"_qs, u"Brick 2 x 4"_qs, 4)
            + u"| ![Minifig No: sh001  Name: Alternate Universe Spider-Man](https://img.bricklink.com/ItemImage/MN/0/sh001.png) "
              u"| 1 | [sh001](https://www.bricklink.com/v2/catalog/catalogitem.page?M=sh001) "
              u"| **Alternate Universe Spider-Man** |\n"
              u"|  |  | [Inv](https://www.bricklink.com/catalogItemInv.asp?M=sh001) "
              u"| **Extra** details |\n"_qs
            + partRow(u"3002"_qs, 5, u"Red"_qs, u"Brick 2 x 3"_qs, 2);

    const Inventory inv = partsOnly(markdown);

    ASSERT_EQ(inv.parts.size(), 2u);
    EXPECT_EQ(inv.parts[0].section, PartSection::Regular);
    EXPECT_EQ(inv.parts[1].section, PartSection::Regular);
    EXPECT_EQ(inv.parts[1].id, u"3002"_qs);

    // the skipped row's follow-up line is not attached to the part before it
    EXPECT_EQ(inv.parts[0].colorName, u"White"_qs);
    EXPECT_TRUE(inv.parts[0].inventoryUrl.isEmpty());
    EXPECT_TRUE(inv.minifigures.isEmpty());
}

TEST(InventoryExtractorTest, FoldsContinuationLines)
{
    const QString markdown = header
            + u"| ![Part No: 93082  Name: Accessories Pack](/ItemImage/PN/42/93082.png) | 1 "
              u"| [93082](https://www.bricklink.com/v2/catalog/catalogitem.page?P=93082&idColor=42) "
              u"| **Medium Blue Accessories Pack** |\n"
              u"|  |  | [Inv](https://www.bricklink.com/catalogItemInv.asp?P=93082&idColor=42) |  |\n"_qs
            + partRow(u"3001"_qs, 1, u"White"_qs, u"Brick 2 x 4"_qs, 4);

    const Inventory inv = partsOnly(markdown);

    ASSERT_EQ(inv.parts.size(), 2u);
    const Part &pack = inv.parts[0];
    EXPECT_EQ(pack.id, u"93082"_qs);
    EXPECT_EQ(pack.name, u"Accessories Pack"_qs);
    EXPECT_EQ(pack.colorName, u"Medium Blue"_qs);
    EXPECT_EQ(pack.quantity, 1);
    EXPECT_EQ(pack.imageUrl, QUrl(u"https://www.bricklink.com/ItemImage/PN/42/93082.png"_qs));
    EXPECT_EQ(pack.inventoryUrl, QUrl(u"https://www.bricklink.com/catalogItemInv.asp?P=93082&idColor=42"_qs));

    EXPECT_EQ(inv.parts[1].id, u"3001"_qs);
    EXPECT_TRUE(inv.parts[1].inventoryUrl.isEmpty());
}

TEST(InventoryExtractorTest, ParsesMinifigureRows)
{
    const QString markdown = setLine(u"41050-1"_qs, u"Ariel's Magical Spell"_qs)
            + u"\n"_qs + header
            + partRow(u"3001"_qs, 1, u"White"_qs, u"Brick 2 x 4"_qs, 4)
            + u"| **Minifigures:** |  |  |  |\n"
              u"| ![Minifig No: dp001  Name: Ariel, Mermaid (Light Nougat)](https://img.bricklink.com/ItemImage/MN/0/dp001.png) "
              u"| 1 | [dp001](https://www.bricklink.com/v2/catalog/catalogitem.page?M=dp001) "
              u"| **Ariel, Mermaid (Light Nougat)** |\n"
              u"|  |  | [Inv](https://www.bricklink.com/catalogItemInv.asp?M=dp001) "
              u"| Catalog: [Minifigures](https://www.bricklink.com/catalogTree.asp?itemType=M):"
              u"[Disney](https://www.bricklink.com/catalogList.asp?catType=M&catString=324) |\n"_qs;

    const Inventory inv = InventoryExtractor::extract(markdown, u"41050-1"_qs, baseUrl);

    ASSERT_EQ(inv.parts.size(), 1u);
    ASSERT_EQ(inv.minifigures.size(), 1);

    const Minifigure &minifig = inv.minifigures.constFirst();
    EXPECT_EQ(minifig.id, u"dp001"_qs);
    EXPECT_EQ(minifig.name, u"Ariel, Mermaid (Light Nougat)"_qs);
    EXPECT_EQ(minifig.quantity, 1);
    EXPECT_EQ(minifig.imageUrl, QUrl(u"https://img.bricklink.com/ItemImage/MN/0/dp001.png"_qs));
    EXPECT_EQ(minifig.catalogUrl, QUrl(u"https://www.bricklink.com/v2/catalog/catalogitem.page?M=dp001"_qs));
    EXPECT_EQ(minifig.inventoryUrl, QUrl(u"https://www.bricklink.com/catalogItemInv.asp?M=dp001"_qs));
    EXPECT_TRUE(minifig.parts.empty());

    ASSERT_EQ(minifig.categories.size(), 2);
    EXPECT_EQ(minifig.categories[0].name, u"Minifigures"_qs);
    EXPECT_FALSE(minifig.categories[0].id.has_value());
    EXPECT_EQ(minifig.categories[1].name, u"Disney"_qs);
    EXPECT_EQ(minifig.categories[1].id, u"324"_qs);
}

TEST(InventoryExtractorTest, PartsOnlySkipsMinifigures)
{
    const QString markdown = header
            + partRow(u"3001"_qs, 1, u"White"_qs, u"Brick 2 x 4"_qs, 4)
            + u"| **Minifigures:** |  |  |  |\n"
              u"| ![Minifig No: sw0001](/m.png) | 1 | [sw0001](https://www.bricklink.com/v2/catalog/catalogitem.page?M=sw0001) | **Luke** |\n"
              u"| **Parts:** |  |  |  |\n"_qs
            + partRow(u"3002"_qs, 1, u"White"_qs, u"Brick 2 x 3"_qs, 2);

    const Inventory inv = partsOnly(markdown);

    ASSERT_EQ(inv.parts.size(), 2u);
    EXPECT_EQ(inv.parts[1].id, u"3002"_qs);
    EXPECT_TRUE(inv.minifigures.isEmpty());
    EXPECT_TRUE(inv.name.isEmpty());
}

TEST(InventoryExtractorTest, RejectsRowsWithoutItemLink)
{
    const QString badLine = u"| ![Minifig No: sw0001](/m.png) | 1 | see catalogitem.page?M=sw0001 | **Luke** |"_qs;
    const QString markdown = setLine(u"1-1"_qs, u"Test"_qs) + header
            + u"| **Minifigures:** |  |  |  |\n"_qs + badLine + u"\n"_qs;

    try {
        InventoryExtractor::extract(markdown, u"1-1"_qs, baseUrl);
        FAIL() << "expected a MalformedRowException";
    } catch (const MalformedRowException &e) {
        EXPECT_EQ(e.line(), badLine);
        EXPECT_TRUE(e.errorString().contains(u"no item link"));
    }
}

TEST(InventoryExtractorTest, RejectsEmptyItemIds)
{
    const QString markdown = header
            + u"| ![img](/p.png) | 1 | [ ](https://www.bricklink.com/v2/catalog/catalogitem.page?P=3001) | **Brick** |\n"_qs;

    EXPECT_THROW(partsOnly(markdown), MalformedRowException);
}

TEST(InventoryExtractorTest, ExtractsSetMetadata)
{
    const QString markdown = u"[Catalog](https://www.bricklink.com/catalog.asp): "
                             u"[Sets](https://www.bricklink.com/catalogTree.asp?itemType=S): "
                             u"[Icons](https://www.bricklink.com/catalogList.asp?catType=S&catString=746): 10294-1\n\n"_qs
            + setLine(u"10294-1"_qs, u"Titanic"_qs) + u"\n"_qs
            + header + partRow(u"3001"_qs, 1, u"White"_qs, u"Brick 2 x 4"_qs, 4);

    const Inventory inv = InventoryExtractor::extract(markdown, u"10294-1"_qs, baseUrl);

    EXPECT_EQ(inv.name, u"Titanic"_qs);
    EXPECT_EQ(inv.thumbnailUrl, QUrl(u"https://img.bricklink.com/SL/10294-1.jpg"_qs));
    ASSERT_EQ(inv.categories.size(), 2);
    EXPECT_EQ(inv.categories[0], (Category { std::nullopt, u"Sets"_qs }));
    EXPECT_EQ(inv.categories[1], (Category { u"746"_qs, u"Icons"_qs }));
}

TEST(InventoryExtractorTest, FallsBackToBoldSetName)
{
    const QString markdown = u"| [![](https://img.bricklink.com/S/75965-1.jpg)](https://www.bricklink.com/catalogItemPic.asp?S=75965-1) "
                             u"| **The Rise of Voldemort** |\n\n"_qs
            + header + partRow(u"3001"_qs, 1, u"White"_qs, u"Brick 2 x 4"_qs, 4);

    const Inventory inv = InventoryExtractor::extract(markdown, u"75965-1"_qs, baseUrl);

    EXPECT_EQ(inv.name, u"The Rise of Voldemort"_qs);
    EXPECT_EQ(inv.thumbnailUrl, QUrl(u"https://img.bricklink.com/SL/75965-1.jpg"_qs));
    EXPECT_TRUE(inv.categories.isEmpty());
}

TEST(InventoryExtractorTest, UsesFirstImageAsThumbnailFallback)
{
    const QString markdown = u"![Box](https://img.bricklink.com/ItemImage/SN/0/1-1.png)\n\n"
                             u"| [Set Name: Fallback Set](https://www.bricklink.com/catalogItemPic.asp?S=1-1) | 1-1 |\n\n"_qs
            + header + partRow(u"3001"_qs, 1, u"White"_qs, u"Brick 2 x 4"_qs, 4);

    const Inventory inv = InventoryExtractor::extract(markdown, u"1-1"_qs, baseUrl);

    EXPECT_EQ(inv.name, u"Fallback Set"_qs);
    EXPECT_EQ(inv.thumbnailUrl, QUrl(u"https://img.bricklink.com/ItemImage/SN/0/1-1.png"_qs));
}

TEST(InventoryExtractorTest, RequiresSetName)
{
    const QString markdown = header + partRow(u"3001"_qs, 1, u"White"_qs, u"Brick 2 x 4"_qs, 4);

    EXPECT_THROW(InventoryExtractor::extract(markdown, u"1-1"_qs, baseUrl), MissingSetNameException);
    EXPECT_NO_THROW(partsOnly(markdown));
}

TEST(InventoryExtractorTest, ResolvesImageUrls)
{
    EXPECT_EQ(InventoryExtractor::absoluteImageUrl(u"/ItemImage/PN/1/3001.png"_qs),
              QUrl(u"https://www.bricklink.com/ItemImage/PN/1/3001.png"_qs));
    EXPECT_EQ(InventoryExtractor::absoluteImageUrl(u"//img.bricklink.com/S/1-1.jpg"_qs),
              QUrl(u"https://img.bricklink.com/S/1-1.jpg"_qs));
    EXPECT_EQ(InventoryExtractor::absoluteImageUrl(u"https://example.com/a.png"_qs),
              QUrl(u"https://example.com/a.png"_qs));

    EXPECT_EQ(InventoryExtractor::highResolutionImageUrl(QUrl(u"https://img.bricklink.com/S/1-1.jpg"_qs)),
              QUrl(u"https://img.bricklink.com/SL/1-1.jpg"_qs));
    EXPECT_EQ(InventoryExtractor::highResolutionImageUrl(QUrl(u"https://example.com/S/1-1.jpg"_qs)),
              QUrl(u"https://example.com/S/1-1.jpg"_qs));
    EXPECT_EQ(InventoryExtractor::highResolutionImageUrl(QUrl(u"https://img.bricklink.com/M/1-1.jpg"_qs)),
              QUrl(u"https://img.bricklink.com/M/1-1.jpg"_qs));
}

TEST(InventoryExtractorTest, ResolvesImagesAgainstPageUrl)
{
    const QUrl mirror(u"http://localhost:8080/catalogItemInv.asp?S=1-1&viewType=R"_qs);
    const QString markdown = u"| [![Set No: 1-1  Name: Mirror Set](/S/1-1.jpg)](/catalogItemPic.asp?S=1-1) | **1-1** |\n\n"_qs
            + header
            + u"| ![Part No: 3001  Name: Brick 2 x 4](/ItemImage/PN/1/3001.png) | 4 "
              u"| [3001](/v2/catalog/catalogitem.page?P=3001&idColor=1) | **White Brick 2 x 4** |\n"_qs;

    const Inventory inv = InventoryExtractor::extract(markdown, u"1-1"_qs, mirror);

    EXPECT_EQ(inv.name, u"Mirror Set"_qs);
    EXPECT_EQ(inv.thumbnailUrl, QUrl(u"http://localhost:8080/S/1-1.jpg"_qs));
    ASSERT_EQ(inv.parts.size(), 1u);
    EXPECT_EQ(inv.parts[0].imageUrl, QUrl(u"http://localhost:8080/ItemImage/PN/1/3001.png"_qs));
    EXPECT_EQ(inv.parts[0].url, QUrl(u"http://localhost:8080/v2/catalog/catalogitem.page?P=3001&idColor=1"_qs));

    EXPECT_EQ(InventoryExtractor::absoluteImageUrl(u"/P/3001.png"_qs, mirror),
              QUrl(u"http://localhost:8080/P/3001.png"_qs));
}

TEST(InventoryExtractorTest, ExtractsSetPage)
{
    const QUrl url(u"https://www.bricklink.com/catalogItemInv.asp?S=10294-1&viewType=R"_qs);
    const QByteArray html = loadFixture(u"set-10294-1.html"_qs);
    ASSERT_FALSE(html.isEmpty());

    const QString markdown = Html::Markdown::fromHtml(html, url);
    EXPECT_FALSE(markdown.contains(u"var header"));
    EXPECT_FALSE(markdown.contains(u"Help"));

    const Inventory inv = InventoryExtractor::extract(markdown, u"10294-1"_qs, url);

    EXPECT_EQ(inv.setNumber, u"10294-1"_qs);
    EXPECT_EQ(inv.name, u"Titanic"_qs);
    EXPECT_EQ(inv.thumbnailUrl, QUrl(u"https://img.bricklink.com/SL/10294-1.jpg"_qs));
    ASSERT_EQ(inv.categories.size(), 2);
    EXPECT_EQ(inv.categories[1].name, u"Icons"_qs);
    EXPECT_EQ(inv.categories[1].id, u"746"_qs);

    ASSERT_EQ(inv.parts.size(), 4u);

    const Part &bar = inv.parts[0];
    EXPECT_EQ(bar.id, u"87994"_qs);
    EXPECT_EQ(bar.colorId, u"11"_qs);
    EXPECT_EQ(bar.colorName, u"Black"_qs);
    EXPECT_EQ(bar.name, u"Bar 3L (Bar Arrow)"_qs);
    EXPECT_EQ(bar.quantity, 2);

    const Part &brick = inv.parts[1];
    EXPECT_EQ(brick.id, u"3001"_qs);
    EXPECT_EQ(brick.imageUrl, QUrl(u"https://www.bricklink.com/ItemImage/PN/1/3001.png"_qs));
    EXPECT_EQ(brick.section, PartSection::Regular);

    const Part &pack = inv.parts[2];
    EXPECT_EQ(pack.id, u"93082"_qs);
    EXPECT_EQ(pack.colorName, u"Medium Blue"_qs);
    EXPECT_EQ(pack.inventoryUrl, QUrl(u"https://www.bricklink.com/catalogItemInv.asp?P=93082&idColor=42"_qs));

    const Part &extra = inv.parts[3];
    EXPECT_EQ(extra.id, u"3001"_qs);
    EXPECT_EQ(extra.section, PartSection::Extra);
    EXPECT_EQ(extra.quantity, 1);

    ASSERT_EQ(inv.minifigures.size(), 1);
    const Minifigure &ariel = inv.minifigures.constFirst();
    EXPECT_EQ(ariel.id, u"dp001"_qs);
    EXPECT_EQ(ariel.name, u"Ariel, Mermaid (Light Nougat)"_qs);
    EXPECT_EQ(ariel.inventoryUrl, QUrl(u"https://www.bricklink.com/catalogItemInv.asp?M=dp001"_qs));
    ASSERT_EQ(ariel.categories.size(), 2);
    EXPECT_EQ(ariel.categories[1].name, u"Disney"_qs);
}
